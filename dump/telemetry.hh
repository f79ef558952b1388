#pragma once



#include <cstdint>
#include <functional>



namespace mediarip
{

// (lba, total, current speed MiB/s)
using ProgressCallback = std::function<void(uint64_t, uint64_t, double)>;


class Telemetry
{
public:
    // a failed read returning faster than this didn't time out, the transport gave up early
    static constexpr double FAST_FAIL_THRESHOLD = 500.;
    // duration substituted for such reads, milliseconds
    static constexpr double FAILURE_PENALTY = 65535.;

    // returns true if the sample produced a valid speed
    bool sample(uint64_t bytes, double duration);
    bool sampleFailure(uint64_t bytes, double duration);

    bool valid() const;
    double currentSpeed() const;
    double maxSpeed() const;
    double minSpeed() const;
    double averageSpeed() const;
    uint64_t totalBytes() const;
    double totalDuration() const;

    void setProgressCallback(ProgressCallback callback);
    void progress(uint64_t lba, uint64_t total) const;

    static double penalizedDuration(double duration);

private:
    double _currentSpeed = 0.;
    double _maxSpeed = 0.;
    double _minSpeed = 0.;
    bool _valid = false;

    uint64_t _totalBytes = 0;
    double _totalDuration = 0.;

    ProgressCallback _progress;
};

}
