// src/LaunchCommand.cpp
#include <Quarry/LaunchCommand.hpp>

#include <utility>

namespace Quarry {

LaunchCommand::LaunchCommand(std::filesystem::path workingDir,
                             const std::optional<std::string>& javaPath,
                             const std::optional<std::vector<std::string>>& javaArgs)
    : m_program(javaPath.value_or("java")), m_workingDir(std::move(workingDir)) {
    if (javaArgs) {
        m_javaArgs = *javaArgs;
    }
}

LaunchCommand& LaunchCommand::argContext(const std::string& key, std::string value) {
    m_context[key] = std::move(value);
    return *this;
}

LaunchCommand& LaunchCommand::arg(std::string value) {
    m_args.push_back(std::move(value));
    return *this;
}

LaunchCommand& LaunchCommand::args(const std::vector<std::string>& values) {
    m_args.insert(m_args.end(), values.begin(), values.end());
    return *this;
}

LaunchCommand& LaunchCommand::env(const std::string& key, std::string value) {
    m_env[key] = std::move(value);
    return *this;
}

std::string LaunchCommand::substitute(const std::string& text, const std::map<std::string, std::string>& context) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        const size_t start = text.find("${", pos);
        if (start == std::string::npos) {
            break;
        }
        const size_t end = text.find('}', start + 2);
        if (end == std::string::npos) {
            break;
        }

        out.append(text, pos, start - pos);
        const std::string name = text.substr(start + 2, end - start - 2);
        auto it = context.find(name);
        if (it != context.end()) {
            out += it->second;
        } else {
            out.append(text, start, end - start + 1);
        }
        pos = end + 1;
    }
    out.append(text, pos, std::string::npos);
    return out;
}

std::vector<std::string> LaunchCommand::arguments() const {
    std::vector<std::string> out = m_javaArgs;
    out.reserve(m_javaArgs.size() + m_args.size());
    for (const auto& a : m_args) {
        out.push_back(substitute(a, m_context));
    }
    return out;
}

std::string LaunchCommand::toString() const {
    std::string out = m_program;
    for (const auto& a : arguments()) {
        out += ' ';
        out += a;
    }
    return out;
}

} // namespace Quarry
