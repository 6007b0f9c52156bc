// include/Quarry/Progress.hpp
#ifndef QUARRY_PROGRESS_HPP
#define QUARRY_PROGRESS_HPP

#include <cstdint>
#include <string>

namespace Quarry {

    // Coarse, per-file progress reporting. Rendering is up to the caller.
    class ProgressSink {
    public:
        virtual ~ProgressSink() = default;

        virtual void begin(const std::string& label, std::uint64_t total) = 0;
        virtual void advance(std::uint64_t current) = 0;
        virtual void end() = 0;
    };

    class NullProgress : public ProgressSink {
    public:
        void begin(const std::string&, std::uint64_t) override {}
        void advance(std::uint64_t) override {}
        void end() override {}
    };

} // namespace Quarry

#endif // QUARRY_PROGRESS_HPP
