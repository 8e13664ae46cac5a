#include <cassert>
#include <cstdio>
#include <QCoreApplication>
#include <QEventLoop>
#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QTimer>
#include "jobs/JobRegistry.h"
#include "jobs/ProgressBroadcaster.h"

static QJsonObject parse(const QByteArray& json) {
    return QJsonDocument::fromJson(json).object();
}

void test_status_messages() {
    Job job;
    job.status = JobStatus::Processing;
    job.progress = 37.5;
    QJsonObject obj = parse(ProgressBroadcaster::statusMessage(job));
    assert(obj["status"].toString() == "processing");
    assert(obj["progress"].toDouble() == 37.5);
    assert(!obj.contains("error"));

    job.status = JobStatus::Error;
    job.error = "Cancelled";
    obj = parse(ProgressBroadcaster::statusMessage(job));
    assert(obj["status"].toString() == "error");
    assert(obj["error"].toString() == "Cancelled");

    obj = parse(ProgressBroadcaster::notFoundMessage(JobKind::Export));
    assert(obj["error"].toString() == "Export not found");
    obj = parse(ProgressBroadcaster::notFoundMessage(std::nullopt));
    assert(obj["status"].toString() == "error");
    assert(obj["error"].toString() == "Job not found");
    printf("PASS: test_status_messages\n");
}

void test_unknown_job_closes_immediately() {
    JobRegistry registry;
    ProgressBroadcaster broadcaster(registry, "missing", std::nullopt, 20);

    QList<QByteArray> updates;
    int closed = 0;
    QObject::connect(&broadcaster, &ProgressBroadcaster::update,
                     [&updates](const QByteArray& json) { updates << json; });
    QObject::connect(&broadcaster, &ProgressBroadcaster::closed, [&closed]() { ++closed; });

    broadcaster.start();
    assert(updates.size() == 1);
    assert(parse(updates[0])["error"].toString() == "Job not found");
    assert(closed == 1);
    assert(!broadcaster.isActive());
    printf("PASS: test_unknown_job_closes_immediately\n");
}

void test_kind_filter() {
    JobRegistry registry;
    QString id = registry.create(JobKind::ProcessVideo, "/o.mp4", "o.mp4");
    ProgressBroadcaster broadcaster(registry, id, JobKind::Export, 20);

    QList<QByteArray> updates;
    QObject::connect(&broadcaster, &ProgressBroadcaster::update,
                     [&updates](const QByteArray& json) { updates << json; });
    broadcaster.start();
    assert(updates.size() == 1);
    assert(parse(updates[0])["error"].toString() == "Export not found");
    printf("PASS: test_kind_filter\n");
}

void test_streams_until_done() {
    JobRegistry registry;
    QString id = registry.create(JobKind::Export, "/e.mp4", "e.mp4");
    ProgressBroadcaster broadcaster(registry, id, JobKind::Export, 20);

    QList<QByteArray> updates;
    QEventLoop loop;
    QObject::connect(&broadcaster, &ProgressBroadcaster::update,
                     [&updates](const QByteArray& json) { updates << json; });
    QObject::connect(&broadcaster, &ProgressBroadcaster::closed, &loop, &QEventLoop::quit);

    broadcaster.start();
    // First status goes out without waiting for the timer
    assert(updates.size() == 1);
    assert(parse(updates[0])["status"].toString() == "processing");

    QTimer::singleShot(60, [&registry, id]() { registry.updateProgress(id, 40.0); });
    QTimer::singleShot(120, [&registry, id]() { registry.updateProgress(id, 80.0); });
    QTimer::singleShot(180, [&registry, id]() { registry.markDone(id); });
    QTimer::singleShot(5000, &loop, &QEventLoop::quit);
    loop.exec();

    assert(!broadcaster.isActive());
    assert(updates.size() >= 3);
    QJsonObject last = parse(updates.last());
    assert(last["status"].toString() == "done");
    assert(last["progress"].toDouble() == 100.0);

    double previous = 0.0;
    for (const QByteArray& json : updates) {
        double p = parse(json)["progress"].toDouble();
        assert(p >= previous);
        previous = p;
    }
    // Only the final message reports done
    for (int i = 0; i + 1 < updates.size(); ++i) {
        assert(parse(updates[i])["status"].toString() == "processing");
    }
    printf("PASS: test_streams_until_done\n");
}

void test_stop_leaves_job_alone() {
    JobRegistry registry;
    QString id = registry.create(JobKind::ProcessVideo, "/o.mp4", "o.mp4");
    {
        ProgressBroadcaster broadcaster(registry, id, std::nullopt, 20);
        broadcaster.start();
        broadcaster.stop();
        assert(!broadcaster.isActive());
    }
    assert(registry.find(id)->status == JobStatus::Processing);
    printf("PASS: test_stop_leaves_job_alone\n");
}

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    test_status_messages();
    test_unknown_job_closes_immediately();
    test_kind_filter();
    test_streams_until_done();
    test_stop_leaves_job_alone();
    printf("All progress broadcaster tests passed.\n");
    return 0;
}
