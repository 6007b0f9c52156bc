// include/Quarry/DownloadWatcher.hpp
#ifndef QUARRY_DOWNLOAD_WATCHER_HPP
#define QUARRY_DOWNLOAD_WATCHER_HPP

#include <Quarry/MessageQueue.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/logger.h>

namespace Quarry {

    struct WatcherMessage {
        enum class Kind {
            FileComplete, // path names the file that appeared
            AllComplete,  // every tracked file is present; the watcher has stopped
            Stop,         // stop() was called
        };

        Kind kind;
        std::filesystem::path path;
    };

    /**
     * @brief Waits for manually downloaded files to show up in a directory.
     *
     * A background thread polls the directory and reports each tracked file the
     * first time it is seen, then AllComplete once all are present. The file
     * state is shared with the calling thread under a mutex.
     */
    class DownloadWatcher {
    public:
        DownloadWatcher(std::filesystem::path watchDir, const std::vector<std::string>& fileNames,
                        std::chrono::milliseconds pollInterval = std::chrono::milliseconds(500));
        ~DownloadWatcher();

        DownloadWatcher(const DownloadWatcher&) = delete;
        DownloadWatcher& operator=(const DownloadWatcher&) = delete;

        // Starts the polling thread. out must outlive the watcher. A watcher can be
        // started again after it finished; tracked files deleted in the meantime are
        // waited for again.
        void start(MessageQueue<WatcherMessage>& out);

        // Asks a running polling thread to exit and waits for it. After AllComplete
        // no Stop message is sent. Safe to call twice.
        void stop();

        bool isFileComplete(const std::string& fileName) const;
        bool isAllComplete() const;

        const std::filesystem::path& watchDir() const { return m_watchDir; }

    private:
        enum class Control { Stop };

        std::filesystem::path m_watchDir;
        std::chrono::milliseconds m_pollInterval;
        std::map<std::string, bool> m_fileState;
        mutable std::mutex m_mutex;
        MessageQueue<Control> m_control;
        std::atomic<bool> m_running{false};
        std::thread m_thread;
        std::shared_ptr<spdlog::logger> m_logger;

        void run(MessageQueue<WatcherMessage>& out);
        // Names of tracked files that appeared since the last poll
        std::vector<std::string> poll();
    };

} // namespace Quarry

#endif // QUARRY_DOWNLOAD_WATCHER_HPP
