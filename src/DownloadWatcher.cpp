// src/DownloadWatcher.cpp
#include <Quarry/DownloadWatcher.hpp>
#include <Quarry/Utils/Logger.hpp>

#include <algorithm>
#include <system_error>
#include <utility>

namespace Quarry {

DownloadWatcher::DownloadWatcher(std::filesystem::path watchDir, const std::vector<std::string>& fileNames,
                                 std::chrono::milliseconds pollInterval)
    : m_watchDir(std::move(watchDir)), m_pollInterval(pollInterval) {
    m_logger = Utils::Logger::GetOrCreateLogger("DownloadWatcher");
    for (const auto& name : fileNames) {
        m_fileState[name] = false;
    }
}

DownloadWatcher::~DownloadWatcher() {
    stop();
}

void DownloadWatcher::start(MessageQueue<WatcherMessage>& out) {
    if (m_running) {
        return;
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }

    // A Stop that raced with AllComplete is still queued from the last run
    while (m_control.tryPop()) {
        m_logger->trace("Discarding stale control message");
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [name, complete] : m_fileState) {
            std::error_code ec;
            if (complete && !std::filesystem::is_regular_file(m_watchDir / name, ec)) {
                complete = false;
            }
        }
    }

    m_logger->info("Watching {} for {} files", m_watchDir.string(), m_fileState.size());
    m_running = true;
    m_thread = std::thread([this, &out] {
        run(out);
        m_running = false;
    });
}

void DownloadWatcher::stop() {
    if (!m_thread.joinable()) {
        return;
    }
    if (m_running) {
        m_control.push(Control::Stop);
    }
    m_thread.join();
}

bool DownloadWatcher::isFileComplete(const std::string& fileName) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_fileState.find(fileName);
    return it != m_fileState.end() && it->second;
}

bool DownloadWatcher::isAllComplete() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::all_of(m_fileState.begin(), m_fileState.end(), [](const auto& entry) { return entry.second; });
}

std::vector<std::string> DownloadWatcher::poll() {
    std::vector<std::string> appeared;
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [name, complete] : m_fileState) {
        if (complete) {
            continue;
        }
        std::error_code ec;
        if (std::filesystem::is_regular_file(m_watchDir / name, ec)) {
            complete = true;
            appeared.push_back(name);
        }
    }
    return appeared;
}

void DownloadWatcher::run(MessageQueue<WatcherMessage>& out) {
    while (true) {
        for (const auto& name : poll()) {
            m_logger->info("{} downloaded", name);
            out.push({WatcherMessage::Kind::FileComplete, m_watchDir / name});
        }

        if (isAllComplete()) {
            out.push({WatcherMessage::Kind::AllComplete, {}});
            return;
        }

        if (m_control.popFor(m_pollInterval)) {
            m_logger->trace("Watcher stopped");
            out.push({WatcherMessage::Kind::Stop, {}});
            return;
        }
    }
}

} // namespace Quarry
