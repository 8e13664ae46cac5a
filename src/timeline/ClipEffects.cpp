#include "ClipEffects.h"

namespace {

struct TransitionName {
    TransitionType type;
    const char* name;
};

constexpr TransitionName kTransitionNames[] = {
    {TransitionType::CrossDissolve, "cross-dissolve"},
    {TransitionType::AdditiveDissolve, "additive-dissolve"},
    {TransitionType::BlurDissolve, "blur-dissolve"},
    {TransitionType::NonAdditiveDissolve, "non-additive-dissolve"},
    {TransitionType::SmoothCut, "smooth-cut"},
    {TransitionType::DipToBlack, "dip-to-black"},
    {TransitionType::DipToWhite, "dip-to-white"},
    {TransitionType::FadeIn, "fade-in"},
    {TransitionType::FadeOut, "fade-out"},
};

} // namespace

QString transitionTypeName(TransitionType type) {
    for (const auto& entry : kTransitionNames) {
        if (entry.type == type) return QString::fromLatin1(entry.name);
    }
    return QString();
}

bool transitionTypeFromName(const QString& name, TransitionType& type) {
    for (const auto& entry : kTransitionNames) {
        if (name == QLatin1String(entry.name)) {
            type = entry.type;
            return true;
        }
    }
    return false;
}

double averageKeyframeX(const std::vector<ReframeKeyframe>& keyframes) {
    if (keyframes.empty()) return 0.5;
    double sum = 0.0;
    for (const auto& kf : keyframes) {
        sum += kf.x;
    }
    return sum / static_cast<double>(keyframes.size());
}
