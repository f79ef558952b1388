#pragma once



#include <atomic>



namespace mediarip
{

// polled by every phase at its checkpoints (top of a chunk, single block retry or verification window)
class CancellationToken
{
public:
    virtual ~CancellationToken() {}

    virtual bool cancelled() const = 0;
};


class CancellationFlag : public CancellationToken
{
public:
    void cancel()
    {
        _flag = true;
    }


    void reset()
    {
        _flag = false;
    }


    bool cancelled() const override
    {
        return _flag;
    }

private:
    std::atomic<bool> _flag = false;
};

}
