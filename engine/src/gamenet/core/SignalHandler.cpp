#include <gamenet/core/SignalHandler.hpp>

#include <cerrno>
#include <system_error>

namespace gamenet::core
{

namespace
{
// signal handler 안에서 안전하게 쓸 수 있는 타입만 쓴다.
volatile std::sig_atomic_t g_stopRequested = 0;
volatile std::sig_atomic_t g_lastSignal = 0;
} // namespace

SignalHandler::SignalHandler()
{
    struct sigaction sa{};
    sa.sa_handler = &SignalHandler::handleSignal;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    for (std::size_t i = 0; i < kSignals.size(); ++i)
    {
        if (::sigaction(kSignals[i], &sa, &oldActions_[i]) != 0)
        {
            const int e = errno;
            for (std::size_t j = 0; j < i; ++j)
            {
                (void)::sigaction(kSignals[j], &oldActions_[j], nullptr);
            }
            throw std::system_error(e, std::generic_category(), "SignalHandler: sigaction failed");
        }
    }
    installed_ = true;
}

SignalHandler::~SignalHandler() noexcept
{
    uninstall();
}

void SignalHandler::uninstall() noexcept
{
    if (!installed_)
    {
        return;
    }
    for (std::size_t i = 0; i < kSignals.size(); ++i)
    {
        (void)::sigaction(kSignals[i], &oldActions_[i], nullptr);
    }
    installed_ = false;
}

void SignalHandler::handleSignal(int signo) noexcept
{
    // 로그, 할당, mutex 금지
    g_stopRequested = 1;
    g_lastSignal = signo;
}

bool SignalHandler::isStopRequested() const noexcept
{
    return g_stopRequested != 0;
}

bool SignalHandler::consumeStopRequest(int *outSignal) noexcept
{
    if (g_stopRequested == 0)
    {
        return false;
    }

    g_stopRequested = 0;
    const int signo = static_cast<int>(g_lastSignal);
    g_lastSignal = 0;

    if (outSignal)
    {
        *outSignal = signo;
    }
    return true;
}

std::string_view SignalHandler::signalName(int signo) noexcept
{
    switch (signo)
    {
    case SIGINT:
        return "SIGINT";
    case SIGTERM:
        return "SIGTERM";
    default:
        return "UNKNOWN";
    }
}

} // namespace gamenet::core
