#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "utils/strings.hh"
#include "utils/throw_line.hh"
#include "file_block_reader.hh"

#ifdef __linux__
#include <linux/fs.h>
#include <linux/hdreg.h>
#include <sys/ioctl.h>
#endif



namespace mediarip
{

FileBlockReader::FileBlockReader(const std::filesystem::path &path, uint32_t block_size, uint32_t timeout)
    : _fd(-1)
    , _blockSize(block_size)
    , _blocksCount(0)
    , _timeout(timeout)
{
    _fd = open(path.c_str(), O_RDONLY);
    if(_fd < 0)
        throw_line("unable to open device (path: {}, error: {})", path.string(), strerror(errno));

    struct stat st;
    if(fstat(_fd, &st) != 0)
    {
        int error = errno;
        close(_fd);
        throw_line("unable to stat device (path: {}, error: {})", path.string(), strerror(error));
    }

    uint64_t size = 0;
#ifdef __linux__
    _identity.platform = "linux";
#else
    _identity.platform = "posix";
#endif

    if(S_ISBLK(st.st_mode))
    {
#ifdef __linux__
        if(ioctl(_fd, BLKGETSIZE64, &size) != 0)
        {
            int error = errno;
            close(_fd);
            throw_line("unable to query device size (path: {}, error: {})", path.string(), strerror(error));
        }

        int sector_size = 0;
        if(!_blockSize && ioctl(_fd, BLKSSZGET, &sector_size) == 0 && sector_size > 0)
            _blockSize = sector_size;

        struct hd_driveid id;
        if(ioctl(_fd, HDIO_GET_IDENTITY, &id) == 0)
        {
            auto model = normalize_string(std::string((const char *)id.model, strnlen((const char *)id.model, sizeof(id.model))));
            _identity.serial = normalize_string(std::string((const char *)id.serial_no, strnlen((const char *)id.serial_no, sizeof(id.serial_no))));

            // ATA model strings usually start with the vendor name
            auto space = model.find(' ');
            if(space == std::string::npos)
                _identity.model = model;
            else
            {
                _identity.manufacturer = model.substr(0, space);
                _identity.model = model.substr(space + 1);
            }
        }
#else
        off_t end = lseek(_fd, 0, SEEK_END);
        if(end > 0)
            size = end;
#endif
    }
    else
        size = st.st_size;

    if(_identity.model.empty())
        _identity.model = path.filename().string();

    if(!_blockSize)
        _blockSize = 512;

    _blocksCount = size / _blockSize;
}


FileBlockReader::~FileBlockReader()
{
    if(_fd >= 0)
        close(_fd);
}


ReadResult FileBlockReader::readBlocks(uint64_t lba, uint32_t count)
{
    ReadResult result;

    uint64_t size = (uint64_t)count * _blockSize;
    result.data.resize(size);

    auto start = std::chrono::steady_clock::now();

    uint64_t rest = size;
    int error = 0;
    while(rest)
    {
        auto n = pread(_fd, result.data.data() + size - rest, rest, (off_t)(lba * _blockSize + size - rest));
        if(n > 0)
            rest -= n;
        // EOF
        else if(n == 0)
            break;
        else if(errno != EINTR && errno != EAGAIN)
        {
            error = errno;
            break;
        }
    }

    result.duration = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    result.data.resize(size - rest);

    if(error == ENODEV || error == ENXIO || error == ENOMEDIUM)
        result.status = ReadStatus::DISCONNECTED;
    else if(error || rest)
        result.status = ReadStatus::ERROR;
    // a late read is as unreliable as a failed one
    else if(_timeout && result.duration > _timeout)
        result.status = ReadStatus::ERROR;
    else
        result.status = ReadStatus::SUCCESS;

    return result;
}


DeviceIdentity FileBlockReader::identity() const
{
    return _identity;
}


uint32_t FileBlockReader::blockSize() const
{
    return _blockSize;
}


uint64_t FileBlockReader::blocksCount() const
{
    return _blocksCount;
}

}
