#include "AudioMixStage.h"
#include "AppConstants.h"
#include "Logging.h"

#include <algorithm>
#include <cmath>

AudioMixStage::AudioMixStage(FilterGraph& graph, const QString& masterAudio)
    : m_graph(graph)
{
    m_inputs << masterAudio;
}

QString AudioMixStage::delaySpec(double timelineStart) {
    const qint64 ms = std::llround(std::max(0.0, timelineStart) * 1000.0);
    return QString("%1|%1").arg(ms);
}

QString AudioMixStage::addClip(const Clip& clip, double trackVolume, int inputIndex) {
    std::vector<Filter> filters;
    filters.push_back(Filter("atrim")
                          .option("start", clip.sourceStart)
                          .option("duration", clip.duration()));
    filters.push_back(Filter("asetpts").arg("PTS-STARTPTS"));
    filters.push_back(Filter("adelay").arg(delaySpec(clip.timelineStart)));
    filters.push_back(Filter("volume").arg(trackVolume * clip.volume));
    filters.push_back(Filter("aresample").arg(QString::number(AppConstants::AudioSampleRate)));

    QString label = m_graph.addChain({QString("%1:a").arg(inputIndex)}, std::move(filters),
                                     QString("a%1_out").arg(inputIndex));
    m_inputs << label;

    qCDebug(REELFORGE_EXPORT_LOG) << "Music clip" << clip.id << "at" << clip.timelineStart
                                  << "s from input" << inputIndex;
    return label;
}

QString AudioMixStage::finish() {
    std::vector<Filter> filters;
    if (m_inputs.size() > 1) {
        filters.push_back(Filter("amix")
                              .option("inputs", QString::number(m_inputs.size()))
                              .option("duration", "shortest")
                              .option("dropout_transition", "2"));
    } else {
        filters.push_back(Filter("anull"));
    }
    return m_graph.addChain(m_inputs, std::move(filters), "a_mixed");
}
