#pragma once



#include <memory>
#include <optional>
#include "dump/resume.hh"
#include "dump/session.hh"
#include "options.hh"
#include "readers/block_reader.hh"
#include "utils/cancel.hh"



namespace mediarip
{

struct Context
{
    std::shared_ptr<BlockReader> reader;
    const CancellationToken *token = nullptr;
    std::unique_ptr<ResumeStore> store;
    std::unique_ptr<Session> session;

    // dump left failed blocks behind
    std::optional<bool> refine;
};


RetryOrder string_to_retry_order(const std::string &value);

int mediarip(Options &options);

}
