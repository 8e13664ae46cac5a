#include <cassert>
#include <cstdio>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>
#include "media/MediaProbe.h"

void test_missing_file() {
    MediaProbe probe;
    bool ok = probe.probe("/nonexistent/clip.mp4");
    assert(!ok);
    assert(probe.errorString().startsWith("Media file not found"));
    assert(probe.info().filePath == "/nonexistent/clip.mp4");
    printf("PASS: test_missing_file\n");
}

void test_unreadable_media() {
    QTemporaryDir dir;
    assert(dir.isValid());
    QString path = QDir(dir.path()).filePath("notes.mp4");
    QFile file(path);
    bool opened = file.open(QIODevice::WriteOnly);
    assert(opened);
    file.write("this is not a video container");
    file.close();

    MediaProbe probe;
    bool ok = probe.probe(path);
    assert(!ok);
    assert(!probe.errorString().isEmpty());
    printf("PASS: test_unreadable_media\n");
}

void test_image_detection() {
    assert(MediaProbe::isImagePath("/tmp/photo.JPG"));
    assert(MediaProbe::isImagePath("still.webp"));
    assert(!MediaProbe::isImagePath("clip.mp4"));
    assert(!MediaProbe::isImagePath("media-17"));
    assert(MediaProbe::isImageContentType("image/png"));
    assert(MediaProbe::isImageContentType(" Image/JPEG "));
    assert(!MediaProbe::isImageContentType("video/mp4"));
    printf("PASS: test_image_detection\n");
}

void test_extension_for_content_type() {
    assert(MediaProbe::extensionForContentType("image/jpeg") == "jpg");
    assert(MediaProbe::extensionForContentType("video/quicktime") == "mov");
    assert(MediaProbe::extensionForContentType("audio/mpeg; charset=binary") == "mp3");
    assert(MediaProbe::extensionForContentType("application/octet-stream").isEmpty());
    printf("PASS: test_extension_for_content_type\n");
}

void test_media_source_kind() {
    // Nothing probed: classification falls back to the path and content type
    MediaProbe probe;
    bool ok = probe.probe("/nonexistent/cover.png");
    assert(!ok);
    MediaSource image = probe.toMediaSource("m1");
    assert(image.kind == MediaKind::Image);
    assert(image.hasVideo);
    assert(!image.hasAudio);
    assert(image.id == "m1");

    ok = probe.probe("/nonexistent/media-2");
    assert(!ok);
    assert(probe.toMediaSource("m2", "image/gif").kind == MediaKind::Image);
    // Neither video nor image: treated as audio
    assert(probe.toMediaSource("m2", "audio/mpeg").kind == MediaKind::Audio);
    assert(mediaKindName(MediaKind::Audio) == "audio");
    printf("PASS: test_media_source_kind\n");
}

int main() {
    test_missing_file();
    test_unreadable_media();
    test_image_detection();
    test_extension_for_content_type();
    test_media_source_kind();
    printf("All media probe tests passed.\n");
    return 0;
}
