#pragma once

#include <QString>
#include <QStringList>
#include <QSet>
#include <vector>

// One filter instance, e.g. trim=start=2:duration=5.
// Positional arguments have an empty key. Values are stored unescaped.
struct FilterOption {
    QString key;
    QString value;
};

class Filter {
public:
    explicit Filter(const QString& name) : m_name(name) {}

    Filter& arg(const QString& value);
    Filter& arg(double value);
    Filter& option(const QString& key, const QString& value);
    Filter& option(const QString& key, double value);

    const QString& name() const { return m_name; }
    const std::vector<FilterOption>& options() const { return m_options; }
    QString value(const QString& key) const;

    QString serialize() const;

private:
    QString m_name;
    std::vector<FilterOption> m_options;
};

// A linear run of filters between labelled pads: [in0][in1]f1,f2[out]
struct FilterChain {
    QStringList inputs;
    std::vector<Filter> filters;
    QString output;

    QString serialize() const;
};

class FilterGraph {
public:
    FilterGraph() = default;

    // Reserve a pad label; a taken hint gets a numeric suffix
    QString uniqueLabel(const QString& hint);

    // Append a chain and return its output label (derived from outputHint)
    QString addChain(const QStringList& inputs, std::vector<Filter> filters,
                     const QString& outputHint);

    const std::vector<FilterChain>& chains() const { return m_chains; }

    // Textual -filter_complex form, chains joined with ';'
    QString serialize() const;

    // Shortest representation that round-trips (5 -> "5", 0.1 -> "0.1")
    static QString formatNumber(double value);
    static QString formatFixed(double value, int decimals);

    // Two-level escaping: option value first, then filtergraph level
    static QString escapeValue(const QString& value);

private:
    std::vector<FilterChain> m_chains;
    QSet<QString> m_labels;
};
