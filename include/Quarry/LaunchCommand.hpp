// include/Quarry/LaunchCommand.hpp
#ifndef QUARRY_LAUNCH_COMMAND_HPP
#define QUARRY_LAUNCH_COMMAND_HPP

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Quarry {

    // Account data the launch arguments need. Obtaining it is the caller's job.
    struct LaunchProfile {
        std::string playerName;
        std::string uuid;
        std::string accessToken;
        std::string clientId;
    };

    /**
     * @brief A java command line under construction.
     *
     * Arguments may contain ${name} placeholders, which are replaced from the
     * argument context when the final argument list is produced. Placeholders
     * without a context value are left untouched. User JVM arguments are passed
     * through verbatim ahead of everything else.
     */
    class LaunchCommand {
    public:
        LaunchCommand(std::filesystem::path workingDir,
                      const std::optional<std::string>& javaPath,
                      const std::optional<std::vector<std::string>>& javaArgs);

        LaunchCommand& argContext(const std::string& key, std::string value);
        LaunchCommand& arg(std::string value);
        LaunchCommand& args(const std::vector<std::string>& values);
        // Extra environment for the spawned process, on top of the caller's own
        LaunchCommand& env(const std::string& key, std::string value);

        // "java" unless overridden
        const std::string& program() const { return m_program; }
        const std::filesystem::path& workingDir() const { return m_workingDir; }
        const std::map<std::string, std::string>& context() const { return m_context; }
        const std::map<std::string, std::string>& environment() const { return m_env; }

        // Java args followed by the substituted arguments
        std::vector<std::string> arguments() const;

        // Program and arguments joined by spaces, for display
        std::string toString() const;

        static std::string substitute(const std::string& text, const std::map<std::string, std::string>& context);

    private:
        std::string m_program;
        std::filesystem::path m_workingDir;
        std::vector<std::string> m_javaArgs;
        std::vector<std::string> m_args;
        std::map<std::string, std::string> m_context;
        std::map<std::string, std::string> m_env;
    };

} // namespace Quarry

#endif // QUARRY_LAUNCH_COMMAND_HPP
