// src/Utils/SemVer.cpp
#include <Quarry/Utils/SemVer.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace Quarry::Utils {

namespace {

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

bool isDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool isNumeric(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), isDigit);
}

// Reads a run of digits at pos. Fails on no digits or on overflow.
std::optional<std::uint64_t> readNumber(const std::string& s, size_t& pos) {
    const size_t start = pos;
    std::uint64_t value = 0;
    while (pos < s.size() && isDigit(s[pos])) {
        const std::uint64_t digit = static_cast<std::uint64_t>(s[pos] - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        ++pos;
    }
    if (pos == start) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::vector<std::string>> splitIdentifiers(const std::string& s) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        const size_t dot = s.find('.', start);
        std::string part = s.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (part.empty()) {
            return std::nullopt;
        }
        parts.push_back(std::move(part));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

// Numeric identifiers compare by value and sort before alphanumeric ones
int compareIdentifiers(const std::string& a, const std::string& b) {
    const bool aNum = isNumeric(a);
    const bool bNum = isNumeric(b);
    if (aNum && bNum) {
        const auto stripA = a.substr(std::min(a.find_first_not_of('0'), a.size() - 1));
        const auto stripB = b.substr(std::min(b.find_first_not_of('0'), b.size() - 1));
        if (stripA.size() != stripB.size()) {
            return stripA.size() < stripB.size() ? -1 : 1;
        }
        return stripA.compare(stripB) < 0 ? -1 : (stripA == stripB ? 0 : 1);
    }
    if (aNum) return -1;
    if (bNum) return 1;
    const int c = a.compare(b);
    return c < 0 ? -1 : (c == 0 ? 0 : 1);
}

// Shorter list wins when one is a prefix of the other
int compareIdentifierLists(const std::vector<std::string>& a, const std::vector<std::string>& b) {
    const size_t common = std::min(a.size(), b.size());
    for (size_t i = 0; i < common; ++i) {
        const int c = compareIdentifiers(a[i], b[i]);
        if (c != 0) return c;
    }
    if (a.size() == b.size()) return 0;
    return a.size() < b.size() ? -1 : 1;
}

std::string join(const std::vector<std::string>& parts) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += '.';
        out += parts[i];
    }
    return out;
}

std::optional<Constraint> parseConstraint(const std::string& token) {
    Comparator op = Comparator::Eq;
    size_t skip = 0;
    if (token.rfind(">=", 0) == 0) {
        op = Comparator::Ge;
        skip = 2;
    } else if (token.rfind("<=", 0) == 0) {
        op = Comparator::Le;
        skip = 2;
    } else if (token.rfind(">", 0) == 0) {
        op = Comparator::Gt;
        skip = 1;
    } else if (token.rfind("<", 0) == 0) {
        op = Comparator::Lt;
        skip = 1;
    } else if (token.rfind("=", 0) == 0) {
        skip = 1;
    }

    auto version = SemVer::parseLenient(token.substr(skip));
    if (!version) return std::nullopt;
    return Constraint{op, *version};
}

} // namespace

std::optional<SemVer> SemVer::parseLenient(const std::string& text) {
    const std::string s = trim(text);
    size_t pos = 0;
    if (pos < s.size() && (s[pos] == 'v' || s[pos] == 'V')) {
        ++pos;
    }

    SemVer version;
    std::vector<std::uint64_t> numbers;

    auto first = readNumber(s, pos);
    if (!first) return std::nullopt;
    numbers.push_back(*first);

    while (pos + 1 < s.size() && s[pos] == '.' && isDigit(s[pos + 1])) {
        ++pos;
        auto next = readNumber(s, pos);
        if (!next) return std::nullopt;
        numbers.push_back(*next);
    }

    version.major = numbers[0];
    if (numbers.size() > 1) version.minor = numbers[1];
    if (numbers.size() > 2) version.patch = numbers[2];
    for (size_t i = 3; i < numbers.size(); ++i) {
        version.build.push_back(std::to_string(numbers[i]));
    }

    if (pos == s.size()) {
        return version;
    }

    std::string rest;
    if (s[pos] == '-' || s[pos] == '.') {
        rest = s.substr(pos + 1);
    } else if (std::isalpha(static_cast<unsigned char>(s[pos])) || s[pos] == '+') {
        rest = s.substr(pos);
    } else {
        return std::nullopt;
    }

    const size_t plus = rest.find('+');
    const std::string preText = rest.substr(0, plus);
    if (!preText.empty()) {
        auto pre = splitIdentifiers(preText);
        if (!pre) return std::nullopt;
        version.pre = std::move(*pre);
    } else if (plus == std::string::npos) {
        return std::nullopt;
    }

    if (plus != std::string::npos) {
        auto build = splitIdentifiers(rest.substr(plus + 1));
        if (!build) return std::nullopt;
        version.build.insert(version.build.end(), build->begin(), build->end());
    }

    return version;
}

std::string SemVer::toString() const {
    std::string out = std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(patch);
    if (!pre.empty()) out += "-" + join(pre);
    if (!build.empty()) out += "+" + join(build);
    return out;
}

int SemVer::compare(const SemVer& other) const {
    if (major != other.major) return major < other.major ? -1 : 1;
    if (minor != other.minor) return minor < other.minor ? -1 : 1;
    if (patch != other.patch) return patch < other.patch ? -1 : 1;

    // A release sorts after any of its pre-releases
    if (pre.empty() != other.pre.empty()) {
        return pre.empty() ? 1 : -1;
    }
    if (const int c = compareIdentifierLists(pre, other.pre); c != 0) {
        return c;
    }

    // Build identifiers break the remaining ties so that 1.2.3.10 > 1.2.3.4
    return compareIdentifierLists(build, other.build);
}

bool Constraint::matches(const SemVer& v) const {
    const int c = v.compare(version);
    switch (op) {
        case Comparator::Eq: return c == 0;
        case Comparator::Lt: return c < 0;
        case Comparator::Le: return c <= 0;
        case Comparator::Gt: return c > 0;
        case Comparator::Ge: return c >= 0;
    }
    return false;
}

std::optional<VersionRange> VersionRange::parse(const std::string& text) {
    VersionRange range;
    std::string token;
    auto flush = [&]() -> bool {
        if (token.empty()) return true;
        auto constraint = parseConstraint(token);
        token.clear();
        if (!constraint) return false;
        range.constraints.push_back(*constraint);
        return true;
    };

    for (char c : text) {
        if (c == ',' || std::isspace(static_cast<unsigned char>(c))) {
            if (!flush()) return std::nullopt;
        } else {
            token += c;
        }
    }
    if (!flush() || range.constraints.empty()) {
        return std::nullopt;
    }
    return range;
}

bool VersionRange::matches(const SemVer& v) const {
    for (const auto& constraint : constraints) {
        if (!constraint.matches(v)) return false;
    }

    if (!v.isPrerelease()) {
        return true;
    }
    return std::any_of(constraints.begin(), constraints.end(), [&](const Constraint& c) {
        return c.version.isPrerelease() && c.version.major == v.major &&
               c.version.minor == v.minor && c.version.patch == v.patch;
    });
}

} // namespace Quarry::Utils
