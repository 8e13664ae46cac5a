#pragma once

#include <QString>
#include <vector>

enum class TransitionType {
    CrossDissolve,
    AdditiveDissolve,
    BlurDissolve,
    NonAdditiveDissolve,
    SmoothCut,
    DipToBlack,
    DipToWhite,
    FadeIn,
    FadeOut
};

struct Transition {
    TransitionType type = TransitionType::CrossDissolve;
    double duration = 0.0;     // seconds

    bool isActive() const { return duration > 0.0; }
};

QString transitionTypeName(TransitionType type);
bool transitionTypeFromName(const QString& name, TransitionType& type);

struct ColorGrading {
    double brightness = 1.0;   // 0-2
    double contrast = 1.0;     // 0-2
    double saturation = 1.0;   // 0-2
    double exposure = 0.0;     // -1 to 1
    double sharpness = 0.0;    // 0-1

    // Brightness and exposure fold into one eq brightness term
    double effectiveBrightness() const { return (brightness - 1.0) + exposure * 0.5; }

    bool isNeutral() const {
        return brightness == 1.0 && contrast == 1.0 &&
               saturation == 1.0 && exposure == 0.0 &&
               sharpness == 0.0;
    }

    void reset() {
        brightness = 1.0;
        contrast = 1.0;
        saturation = 1.0;
        exposure = 0.0;
        sharpness = 0.0;
    }
};

struct ReframeKeyframe {
    double time = 0.0;    // relative to the clip's source start
    double x = 0.5;       // crop center, 0-1 of source width
    double y = 0.5;       // crop center, 0-1 of source height
    double scale = 1.0;   // 1 = fit height
};

double averageKeyframeX(const std::vector<ReframeKeyframe>& keyframes);
