#include "FilterGraph.h"
#include <QLocale>

namespace {

QString escapeWith(const QString& text, const QString& special) {
    QString out;
    out.reserve(text.size() + 4);
    for (const QChar ch : text) {
        if (special.contains(ch)) out += QLatin1Char('\\');
        out += ch;
    }
    return out;
}

} // namespace

Filter& Filter::arg(const QString& value) {
    m_options.push_back({QString(), value});
    return *this;
}

Filter& Filter::arg(double value) {
    return arg(FilterGraph::formatNumber(value));
}

Filter& Filter::option(const QString& key, const QString& value) {
    m_options.push_back({key, value});
    return *this;
}

Filter& Filter::option(const QString& key, double value) {
    return option(key, FilterGraph::formatNumber(value));
}

QString Filter::value(const QString& key) const {
    for (const auto& opt : m_options) {
        if (opt.key == key) return opt.value;
    }
    return QString();
}

QString Filter::serialize() const {
    if (m_options.empty()) return m_name;

    QStringList parts;
    for (const auto& opt : m_options) {
        QString escaped = FilterGraph::escapeValue(opt.value);
        parts << (opt.key.isEmpty() ? escaped : opt.key + '=' + escaped);
    }
    return m_name + '=' + parts.join(':');
}

QString FilterChain::serialize() const {
    QString out;
    for (const auto& in : inputs) {
        out += '[' + in + ']';
    }
    QStringList body;
    for (const auto& f : filters) {
        body << f.serialize();
    }
    out += body.join(',');
    if (!output.isEmpty()) {
        out += '[' + output + ']';
    }
    return out;
}

QString FilterGraph::uniqueLabel(const QString& hint) {
    QString label = hint;
    int suffix = 2;
    while (m_labels.contains(label)) {
        label = QString("%1_%2").arg(hint).arg(suffix++);
    }
    m_labels.insert(label);
    return label;
}

QString FilterGraph::addChain(const QStringList& inputs, std::vector<Filter> filters,
                              const QString& outputHint) {
    FilterChain chain;
    chain.inputs = inputs;
    chain.filters = std::move(filters);
    chain.output = uniqueLabel(outputHint);
    m_chains.push_back(std::move(chain));
    return m_chains.back().output;
}

QString FilterGraph::serialize() const {
    QStringList out;
    for (const auto& chain : m_chains) {
        out << chain.serialize();
    }
    return out.join(';');
}

QString FilterGraph::formatNumber(double value) {
    if (value == 0.0) return QStringLiteral("0");
    return QString::number(value, 'f', QLocale::FloatingPointShortest);
}

QString FilterGraph::formatFixed(double value, int decimals) {
    return QString::number(value, 'f', decimals);
}

QString FilterGraph::escapeValue(const QString& value) {
    QString optionLevel = escapeWith(value, QStringLiteral("\\':"));
    return escapeWith(optionLevel, QStringLiteral("\\'[],;"));
}
