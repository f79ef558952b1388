#pragma once



#include <cstdint>
#include <string>
#include "dump/bad_blocks.hh"
#include "dump/extent_set.hh"
#include "dump/resume.hh"
#include "dump/telemetry.hh"
#include "utils/cancel.hh"



namespace mediarip
{

enum class RetryOrder
{
    // ascending on odd passes, descending on even passes
    ALTERNATE,
    FORWARD,
    REVERSE
};


enum class Outcome
{
    COMPLETED,
    CANCELLED,
    // device disconnect or a read error with stop on error requested
    FATAL
};


struct PhaseResult
{
    Outcome outcome = Outcome::COMPLETED;
    std::string message;
};


struct SessionConfig
{
    uint64_t total_blocks = 0;
    uint32_t block_size = 512;
    uint32_t chunk_size = 64;
    uint32_t max_retry_passes = 5;
    bool persistent_recovery = false;
    bool stop_on_error = false;
    RetryOrder retry_order = RetryOrder::ALTERNATE;
    bool verbose = false;
};


struct AttemptInfo
{
    std::string software;
    std::string version;
    std::string os;
};


// one acquisition run: configuration, bookkeeping and the cancellation token shared by every phase
class Session
{
public:
    // appends a new attempt record to the ledger, the cumulative extent set is rebuilt from prior attempts
    Session(const SessionConfig &session_config, ResumeLedger resume_ledger, const AttemptInfo &attempt, const CancellationToken &cancel_token, const ResumeStore *store = nullptr);

    const SessionConfig config;
    ResumeLedger ledger;
    // all attempts
    ExtentSet extents;
    // this attempt only
    ExtentSet attemptExtents;
    Telemetry telemetry;
    const CancellationToken &token;

    bool cancelled() const;

    void recordSuccess(uint64_t lba, uint64_t count);
    void recordFailure(uint64_t lba, uint64_t count);
    // bad block confirmed readable by a recovery pass
    void recordRecovered(uint64_t lba);

    // writes the current attempt extents into the ledger and saves it if there is a store
    void persist();

private:
    const ResumeStore *_store;
};

}
