#pragma once



#include <signal.h>
#include "utils/cancel.hh"
#include "utils/throw_line.hh"



namespace mediarip
{

// first signal requests a controlled stop, signals outside of an engaged section behave by default
template<int S>
class Signal : public CancellationToken
{
public:
    Signal()
    {
        setHandler();
        engage();
    }


    ~Signal()
    {
        disengage();
        resetHandler();
    }


    void engage()
    {
        _flag = 2;
    }


    void disengage()
    {
        _flag = 0;
    }


    bool interrupt() const
    {
        return _flag == 1;
    }


    bool cancelled() const override
    {
        return interrupt();
    }


    static void raiseDefault()
    {
        resetHandler();
        ::raise(S);
        setHandler();
    }


    Signal(Signal const &) = delete;
    void operator=(Signal const &) = delete;

private:
    static volatile sig_atomic_t _flag;

    static void setHandler()
    {
        auto old_handler = signal(S, handler);
        if(old_handler != SIG_DFL)
        {
            signal(S, old_handler);
            throw_line("signal handler already set (signal: {})", S);
        }
    }


    static void resetHandler()
    {
        signal(S, SIG_DFL);
    }


    static void handler(int)
    {
        if(!_flag)
            raiseDefault();
        else if(_flag == 2)
            _flag = 1;
    }
};

template<int S>
volatile sig_atomic_t Signal<S>::_flag;

using SignalINT = Signal<SIGINT>;

}
