#include "settings_loader.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>

#include <string>
#include <utility>
#include <vector>

#include <boost/regex.hpp>

using pdfoutline::ConfigError;

namespace {
    [[noreturn]] void fail(const QString &origin, const QString &what) {
        throw ConfigError(QString("%1: %2").arg(origin, what).toStdString());
    }

    QJsonValue requireKey(const QJsonObject &obj, const QString &key, const QString &origin) {
        if (!obj.contains(key))
            fail(origin, QString("missing required key '%1'").arg(key));
        return obj.value(key);
    }

    double toNumber(const QJsonValue &v, const QString &key, const QString &origin) {
        if (!v.isDouble())
            fail(origin, QString("'%1' must be a number").arg(key));
        return v.toDouble();
    }

    int toInt(const QJsonValue &v, const QString &key, const QString &origin) {
        const double d = toNumber(v, key, origin);
        const int i = v.toInt();
        if (static_cast<double>(i) != d)
            fail(origin, QString("'%1' must be an integer").arg(key));
        return i;
    }

    int toPositiveInt(const QJsonValue &v, const QString &key, const QString &origin) {
        const int i = toInt(v, key, origin);
        if (i <= 0)
            fail(origin, QString("'%1' must be greater than zero").arg(key));
        return i;
    }

    std::string toString(const QJsonValue &v, const QString &key, const QString &origin) {
        if (!v.isString())
            fail(origin, QString("'%1' must be a string").arg(key));
        return v.toString().toStdString();
    }

    std::vector<std::string> toStringList(const QJsonValue &v, const QString &key, const QString &origin) {
        if (!v.isArray())
            fail(origin, QString("'%1' must be an array of strings").arg(key));

        std::vector<std::string> out;
        for (const QJsonValue &item: v.toArray())
            out.push_back(toString(item, key, origin));
        return out;
    }

    boost::regex toRegex(const std::string &pattern,
                         const boost::regex::flag_type flags,
                         const QString &key,
                         const QString &origin) {
        try {
            return boost::regex(pattern, flags);
        } catch (const boost::regex_error &e) {
            fail(origin, QString("invalid regular expression in '%1' (%2): %3")
                 .arg(key, QString::fromStdString(pattern), QString::fromUtf8(e.what())));
        }
    }

    pdfoutline::ProminenceGate toGate(const QJsonValue &v, const QString &key, const QString &origin) {
        if (!v.isObject())
            fail(origin, QString("'%1' must be an object").arg(key));

        const QJsonObject obj = v.toObject();
        pdfoutline::ProminenceGate gate;
        if (obj.contains("min_size_delta"))
            gate.minSizeDelta = toNumber(obj.value("min_size_delta"), key + ".min_size_delta", origin);
        if (obj.contains("bold_passes"))
            gate.boldPasses = obj.value("bold_passes").toBool(gate.boldPasses);
        if (obj.contains("require_bold"))
            gate.requireBold = obj.value("require_bold").toBool(gate.requireBold);
        if (obj.contains("max_words"))
            gate.maxWords = toInt(obj.value("max_words"), key + ".max_words", origin);
        return gate;
    }

    pdfoutline::OverrideRule toOverride(const QJsonValue &v, const int index, const QString &origin) {
        const QString key = QString("level_overrides[%1]").arg(index);
        if (!v.isObject())
            fail(origin, QString("'%1' must be an object").arg(key));

        const QJsonObject obj = v.toObject();
        pdfoutline::OverrideRule rule;

        const std::string pattern = toString(requireKey(obj, "pattern", origin), key + ".pattern", origin);
        rule.pattern = toRegex(pattern, boost::regex::perl, key + ".pattern", origin);
        rule.name = obj.contains("name")
                        ? toString(obj.value("name"), key + ".name", origin)
                        : pattern;

        if (obj.contains("level")) {
            const std::string name = toString(obj.value("level"), key + ".level", origin);
            const auto level = pdfoutline::ParseLevel(name);
            if (!level || *level == pdfoutline::Level::Unknown)
                fail(origin, QString("'%1.level' must be one of H1, H2, H3, H4").arg(key));
            rule.level = *level;
        }
        if (obj.contains("classify"))
            rule.classifyGate = toGate(obj.value("classify"), key + ".classify", origin);
        if (obj.contains("level_gate"))
            rule.levelGate = toGate(obj.value("level_gate"), key + ".level_gate", origin);
        rule.suppress = obj.value("suppress").toBool(false);

        if (obj.contains("document")) {
            const std::string doc = toString(obj.value("document"), key + ".document", origin);
            rule.documentPattern = toRegex(doc, boost::regex::perl | boost::regex::icase, key + ".document", origin);
        }
        if (obj.contains("pages")) {
            const QJsonValue pages = obj.value("pages");
            if (!pages.isArray())
                fail(origin, QString("'%1.pages' must be an array of integers").arg(key));
            for (const QJsonValue &p: pages.toArray())
                rule.physicalPages.push_back(toInt(p, key + ".pages", origin));
        }

        if (!rule.level && !rule.classifyGate && !rule.suppress)
            fail(origin, QString("'%1' has no effect (needs level, classify or suppress)").arg(key));

        return rule;
    }
} // anonymous namespace

pdfoutline::Settings parseSettings(const QByteArray &json, const QString &origin) {
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        fail(origin, QString("JSON parse error at offset %1: %2")
             .arg(parseError.offset)
             .arg(parseError.errorString()));
    if (!doc.isObject())
        fail(origin, QStringLiteral("top-level value must be an object"));

    const QJsonObject root = doc.object();
    pdfoutline::Settings settings;

    // ----- thresholds -----
    const QJsonValue thresholdsValue = requireKey(root, "heading_detection_thresholds", origin);
    if (!thresholdsValue.isObject())
        fail(origin, QStringLiteral("'heading_detection_thresholds' must be an object"));
    const QJsonObject t = thresholdsValue.toObject();

    settings.thresholds.fontSizeDifferenceFromDominant =
            toNumber(requireKey(t, "font_size_difference_from_dominant", origin),
                     "font_size_difference_from_dominant", origin);
    settings.thresholds.boldFontSizeMinRatioToDominant =
            toNumber(requireKey(t, "bold_font_size_min_ratio_to_dominant", origin),
                     "bold_font_size_min_ratio_to_dominant", origin);
    settings.thresholds.maxWordsForBoldHeading =
            toPositiveInt(requireKey(t, "max_words_for_bold_heading", origin),
                          "max_words_for_bold_heading", origin);
    settings.thresholds.maxWordsForAllCapsHeading =
            toPositiveInt(requireKey(t, "max_words_for_all_caps_heading", origin),
                          "max_words_for_all_caps_heading", origin);

    // ----- keywords / noise -----
    settings.headingKeywords =
            toStringList(requireKey(root, "common_heading_keywords", origin), "common_heading_keywords", origin);

    for (const auto &pattern: toStringList(requireKey(root, "common_footer_header_patterns", origin),
                                           "common_footer_header_patterns", origin)) {
        try {
            settings.noisePatterns.push_back(pdfoutline::MakeNoisePattern(pattern));
        } catch (const boost::regex_error &e) {
            fail(origin, QString("invalid regular expression in 'common_footer_header_patterns' (%1): %2")
                 .arg(QString::fromStdString(pattern), QString::fromUtf8(e.what())));
        }
    }

    if (root.contains("max_headings_per_page"))
        settings.maxHeadingsPerPage = toPositiveInt(root.value("max_headings_per_page"),
                                                    "max_headings_per_page", origin);

    // ----- override table -----
    if (root.contains("level_overrides")) {
        const QJsonValue table = root.value("level_overrides");
        if (!table.isArray())
            fail(origin, QStringLiteral("'level_overrides' must be an array"));
        int index = 0;
        for (const QJsonValue &row: table.toArray())
            settings.overrides.push_back(toOverride(row, index++, origin));
    }

    // ----- page offsets -----
    if (root.contains("page_offsets")) {
        const QJsonValue offsets = root.value("page_offsets");
        if (!offsets.isArray())
            fail(origin, QStringLiteral("'page_offsets' must be an array"));
        for (const QJsonValue &row: offsets.toArray()) {
            if (!row.isObject())
                fail(origin, QStringLiteral("'page_offsets' entries must be objects"));
            const QJsonObject obj = row.toObject();
            pdfoutline::PageOffsetRule rule;
            rule.documentPattern = toRegex(toString(requireKey(obj, "document", origin), "page_offsets.document", origin),
                                           boost::regex::perl | boost::regex::icase,
                                           "page_offsets.document", origin);
            rule.offset = toInt(requireKey(obj, "offset", origin), "page_offsets.offset", origin);
            settings.pageOffsets.push_back(std::move(rule));
        }
    }

    // ----- title -----
    if (root.contains("title")) {
        const QJsonValue titleValue = root.value("title");
        if (!titleValue.isObject())
            fail(origin, QStringLiteral("'title' must be an object"));
        const QJsonObject title = titleValue.toObject();

        if (title.contains("fragments"))
            settings.title.fragments = toStringList(title.value("fragments"), "title.fragments", origin);
        if (title.contains("banner_phrases"))
            settings.title.bannerPhrases = toStringList(title.value("banner_phrases"), "title.banner_phrases", origin);
        if (title.contains("min_length")) {
            const int minLength = toInt(title.value("min_length"), "title.min_length", origin);
            if (minLength < 0)
                fail(origin, QStringLiteral("'title.min_length' must not be negative"));
            settings.title.minLength = static_cast<std::size_t>(minLength);
        }
    }

    return settings;
}

pdfoutline::Settings loadSettings(const QString &path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        fail(path, QString("cannot open configuration: %1").arg(file.errorString()));

    const QByteArray json = file.readAll();
    file.close();
    return parseSettings(json, path);
}
