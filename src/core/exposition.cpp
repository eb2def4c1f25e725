/**
 * @file exposition.cpp
 * @brief Text exposition writer and parser.
 *
 * @copyright Copyright (c) 2024 FreeProbe Contributors
 * @license MIT License
 */

#include "freeprobe/core/exposition.hpp"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace freeprobe {
namespace core {

namespace {

bool isNameStart(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == ':';
}

bool isNameChar(char c) {
    return isNameStart(c) || (c >= '0' && c <= '9');
}

bool parseValue(const std::string& token, double& value) {
    if (token == "NaN") {
        value = std::numeric_limits<double>::quiet_NaN();
        return true;
    }
    if (token == "+Inf" || token == "Inf") {
        value = std::numeric_limits<double>::infinity();
        return true;
    }
    if (token == "-Inf") {
        value = -std::numeric_limits<double>::infinity();
        return true;
    }
    if (token.empty()) {
        return false;
    }
    std::istringstream in(token);
    in.imbue(std::locale::classic());
    in >> value;
    return !in.fail() && in.peek() == std::char_traits<char>::eof();
}

/// Parse `{a="x",b="y"}` starting at text[pos] == '{'.
bool parseLabels(const std::string& line, size_t& pos, LabelSet& labels, std::string& error) {
    ++pos;  // '{'
    while (pos < line.size()) {
        if (line[pos] == '}') {
            ++pos;
            return true;
        }

        size_t start = pos;
        if (!isNameStart(line[pos])) {
            error = "invalid label name";
            return false;
        }
        while (pos < line.size() && isNameChar(line[pos])) {
            ++pos;
        }
        std::string name = line.substr(start, pos - start);

        if (pos + 1 >= line.size() || line[pos] != '=' || line[pos + 1] != '"') {
            error = "expected =\" after label " + name;
            return false;
        }
        pos += 2;

        std::string value;
        bool closed = false;
        while (pos < line.size()) {
            char c = line[pos++];
            if (c == '"') {
                closed = true;
                break;
            }
            if (c == '\\') {
                if (pos >= line.size()) {
                    break;
                }
                char e = line[pos++];
                if (e == 'n') {
                    value.push_back('\n');
                } else if (e == '\\' || e == '"') {
                    value.push_back(e);
                } else {
                    error = "invalid escape in label " + name;
                    return false;
                }
            } else {
                value.push_back(c);
            }
        }
        if (!closed) {
            error = "unterminated value for label " + name;
            return false;
        }
        labels[name] = value;

        if (pos < line.size() && line[pos] == ',') {
            ++pos;
        }
    }
    error = "unterminated label set";
    return false;
}

}  // namespace

std::string formatSampleValue(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(std::numeric_limits<double>::max_digits10) << value;
    return oss.str();
}

std::string escapeLabelValue(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '"':  out += "\\\""; break;
            case '\n': out += "\\n"; break;
            default:   out.push_back(c); break;
        }
    }
    return out;
}

std::string serializeSamples(const std::vector<MetricSample>& samples) {
    std::string out;
    for (const auto& sample : samples) {
        out += sample.name;
        if (!sample.labels.empty()) {
            out.push_back('{');
            bool first = true;
            for (const auto& label : sample.labels) {
                if (!first) {
                    out.push_back(',');
                }
                first = false;
                out += label.first;
                out += "=\"";
                out += escapeLabelValue(label.second);
                out.push_back('"');
            }
            out.push_back('}');
        }
        out.push_back(' ');
        out += formatSampleValue(sample.value);
        out.push_back('\n');
    }
    return out;
}

bool parseSamples(const std::string& text, std::vector<MetricSample>& out, std::string* error) {
    std::istringstream in(text);
    std::string line;
    int lineNo = 0;

    auto fail = [&](const std::string& reason) {
        if (error) {
            *error = "line " + std::to_string(lineNo) + ": " + reason;
        }
        return false;
    };

    while (std::getline(in, line)) {
        ++lineNo;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        size_t pos = line.find_first_not_of(" \t");
        if (pos == std::string::npos || line[pos] == '#') {
            continue;
        }

        MetricSample sample;
        size_t start = pos;
        if (!isNameStart(line[pos])) {
            return fail("invalid metric name");
        }
        while (pos < line.size() && isNameChar(line[pos])) {
            ++pos;
        }
        sample.name = line.substr(start, pos - start);

        if (pos < line.size() && line[pos] == '{') {
            std::string reason;
            if (!parseLabels(line, pos, sample.labels, reason)) {
                return fail(reason);
            }
        }

        if (pos >= line.size() || (line[pos] != ' ' && line[pos] != '\t')) {
            return fail("missing value");
        }
        pos = line.find_first_not_of(" \t", pos);
        if (pos == std::string::npos) {
            return fail("missing value");
        }
        size_t end = line.find_first_of(" \t", pos);
        std::string token = line.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if (!parseValue(token, sample.value)) {
            return fail("invalid value '" + token + "'");
        }
        // A trailing timestamp is allowed and ignored

        out.push_back(std::move(sample));
    }
    return true;
}

}  // namespace core
}  // namespace freeprobe
