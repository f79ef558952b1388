#include <cmath>
#include <utility>
#include "telemetry.hh"



namespace mediarip
{

constexpr double MIB = 1024. * 1024.;


bool Telemetry::sample(uint64_t bytes, double duration)
{
    _totalBytes += bytes;
    if(std::isfinite(duration) && duration > 0.)
        _totalDuration += duration;

    double speed = (double)bytes / MIB / (duration / 1000.);
    if(!std::isfinite(speed) || speed <= 0.)
        return false;

    _currentSpeed = speed;
    if(!_valid)
    {
        _maxSpeed = speed;
        _minSpeed = speed;
        _valid = true;
    }
    else
    {
        if(_currentSpeed > _maxSpeed)
            _maxSpeed = _currentSpeed;
        if(_currentSpeed < _minSpeed)
            _minSpeed = _currentSpeed;
    }

    return true;
}


bool Telemetry::sampleFailure(uint64_t bytes, double duration)
{
    return sample(bytes, penalizedDuration(duration));
}


double Telemetry::penalizedDuration(double duration)
{
    return duration < FAST_FAIL_THRESHOLD ? FAILURE_PENALTY : duration;
}


bool Telemetry::valid() const
{
    return _valid;
}


double Telemetry::currentSpeed() const
{
    return _currentSpeed;
}


double Telemetry::maxSpeed() const
{
    return _maxSpeed;
}


double Telemetry::minSpeed() const
{
    return _minSpeed;
}


double Telemetry::averageSpeed() const
{
    return _totalDuration > 0. ? (double)_totalBytes / MIB / (_totalDuration / 1000.) : 0.;
}


uint64_t Telemetry::totalBytes() const
{
    return _totalBytes;
}


double Telemetry::totalDuration() const
{
    return _totalDuration;
}


void Telemetry::setProgressCallback(ProgressCallback callback)
{
    _progress = std::move(callback);
}


void Telemetry::progress(uint64_t lba, uint64_t total) const
{
    if(_progress)
        _progress(lba, total, _currentSpeed);
}

}
