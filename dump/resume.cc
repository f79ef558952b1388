#include <fstream>
#include <sstream>
#include "utils/logger.hh"
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "resume.hh"



namespace mediarip
{

constexpr uint32_t LEDGER_VERSION = 1;


ResumeStore::ResumeStore(std::filesystem::path path)
    : _path(std::move(path))
{
    ;
}


const std::filesystem::path &ResumeStore::path() const
{
    return _path;
}


bool ResumeStore::exists() const
{
    return std::filesystem::exists(_path);
}


std::optional<ResumeLedger> ResumeStore::read() const
{
    if(!exists())
        return std::nullopt;

    std::ifstream ifs(_path, std::ifstream::in);
    if(!ifs.is_open())
        throw_line("unable to open file ({})", _path.filename().string());

    std::stringstream ss;
    ss << ifs.rdbuf();

    return parse(ss.str());
}


std::optional<ResumeLedger> ResumeStore::load(const DeviceIdentity &identity, uint64_t total_blocks, uint32_t block_size) const
{
    auto l = read();
    if(!l)
        return std::nullopt;

    auto &ledger = *l;

    if(ledger.identity != identity)
        throw ResumeMismatch(fmt::format("resume ledger belongs to a different device (ledger: {} {} {} {}, device: {} {} {} {}), not resuming",
            ledger.identity.manufacturer, ledger.identity.model, ledger.identity.serial, ledger.identity.platform, identity.manufacturer, identity.model, identity.serial,
            identity.platform));

    if(ledger.total_blocks != total_blocks || ledger.block_size != block_size)
        throw ResumeMismatch(fmt::format("resume ledger geometry mismatch (ledger: {} x {}, device: {} x {}), not resuming", ledger.total_blocks, ledger.block_size,
            total_blocks, block_size));

    if(ledger.next_block > ledger.total_blocks)
        throw_line("resume ledger is corrupt, next block past the end of the medium ({} > {})", ledger.next_block, ledger.total_blocks);

    return l;
}


void ResumeStore::save(const ResumeLedger &ledger) const
{
    auto tmp_path = _path;
    tmp_path += ".tmp";

    {
        std::ofstream ofs(tmp_path, std::ofstream::out | std::ofstream::trunc);
        if(!ofs.is_open())
            throw_line("unable to create file ({})", tmp_path.filename().string());

        ofs << serialize(ledger);
        ofs.flush();
        if(ofs.fail())
            throw_line("write failed ({})", tmp_path.filename().string());
    }

    std::error_code ec;
    std::filesystem::rename(tmp_path, _path, ec);
    if(ec)
        throw_line("unable to replace file ({}), {}", _path.filename().string(), ec.message());
}


void ResumeStore::remove() const
{
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if(ec)
        LOG("warning: unable to remove resume ledger ({}), {}", _path.filename().string(), ec.message());
}


std::string ResumeStore::serialize(const ResumeLedger &ledger)
{
    std::string text;

    text += "# mediarip resume ledger\n";
    text += fmt::format("version={}\n", LEDGER_VERSION);
    text += fmt::format("next_block={}\n", ledger.next_block);
    text += fmt::format("total_blocks={}\n", ledger.total_blocks);
    text += fmt::format("block_size={}\n", ledger.block_size);
    text += fmt::format("manufacturer={}\n", ledger.identity.manufacturer);
    text += fmt::format("model={}\n", ledger.identity.model);
    text += fmt::format("serial={}\n", ledger.identity.serial);
    text += fmt::format("platform={}\n", ledger.identity.platform);
    text += fmt::format("bad_blocks={}\n", ranges_to_string(ledger.bad_blocks.toRanges()));

    for(auto const &a : ledger.attempts)
    {
        text += fmt::format("attempt.software={}\n", a.software);
        text += fmt::format("attempt.version={}\n", a.version);
        text += fmt::format("attempt.os={}\n", a.os);
        text += fmt::format("attempt.extents={}\n", ranges_to_string(a.extents));
    }

    return text;
}


ResumeLedger ResumeStore::parse(const std::string &text)
{
    ResumeLedger ledger;

    bool version_found = false;

    std::istringstream iss(text);
    uint32_t line_number = 0;
    for(std::string line; std::getline(iss, line);)
    {
        ++line_number;

        if(line.empty() || line[0] == '#')
            continue;

        auto separator = line.find('=');
        if(separator == std::string::npos)
            throw_line("resume ledger syntax error (line: {})", line_number);

        auto key = trim(line.substr(0, separator));
        auto value = trim(line.substr(separator + 1));

        if(key == "version")
        {
            if(str_to_uint(value) != LEDGER_VERSION)
                throw_line("unsupported resume ledger version (version: {})", value);
            version_found = true;
        }
        else if(key == "next_block")
            ledger.next_block = str_to_uint(value);
        else if(key == "total_blocks")
            ledger.total_blocks = str_to_uint(value);
        else if(key == "block_size")
            ledger.block_size = (uint32_t)str_to_uint(value);
        else if(key == "manufacturer")
            ledger.identity.manufacturer = value;
        else if(key == "model")
            ledger.identity.model = value;
        else if(key == "serial")
            ledger.identity.serial = value;
        else if(key == "platform")
            ledger.identity.platform = value;
        else if(key == "bad_blocks")
            ledger.bad_blocks.addRanges(string_to_ranges(value));
        else if(key == "attempt.software")
            ledger.attempts.push_back(AttemptRecord{ value });
        else if(key.starts_with("attempt."))
        {
            if(ledger.attempts.empty())
                throw_line("resume ledger attempt field outside of an attempt record (line: {})", line_number);

            auto &attempt = ledger.attempts.back();
            if(key == "attempt.version")
                attempt.version = value;
            else if(key == "attempt.os")
                attempt.os = value;
            else if(key == "attempt.extents")
                attempt.extents = string_to_ranges(value);
            else
                throw_line("unknown resume ledger key ({}, line: {})", key, line_number);
        }
        else
            throw_line("unknown resume ledger key ({}, line: {})", key, line_number);
    }

    if(!version_found)
        throw_line("resume ledger version is missing");

    return ledger;
}

}
