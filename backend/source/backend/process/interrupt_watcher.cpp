#include <backend/process/interrupt_watcher.hpp>

#include <log/log.hpp>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <thread>

struct InterruptWatcher::Implementation
{
    std::shared_ptr<ProcessSupervisor> supervisor;
    boost::asio::io_context context{};
    boost::asio::signal_set signals{context};
    std::atomic<int> received{0};
    std::thread thread{};

    explicit Implementation(std::shared_ptr<ProcessSupervisor> supervisor)
        : supervisor{std::move(supervisor)}
    {}

    void waitForSignal()
    {
        signals.async_wait([this](boost::system::error_code const& ec, int signal) {
            if (ec)
                return;

            int expected = 0;
            received.compare_exchange_strong(expected, signal);
            Log::warn("Received signal {}, stopping the transfer tool.", signal);
            supervisor->interrupt(signal);
            waitForSignal();
        });
    }
};

InterruptWatcher::InterruptWatcher(std::shared_ptr<ProcessSupervisor> supervisor, std::vector<int> const& signals)
    : impl_{std::make_unique<Implementation>(std::move(supervisor))}
{
    for (auto const signal : signals)
    {
        boost::system::error_code ec;
        impl_->signals.add(signal, ec);
        if (ec)
            Log::error("Cannot watch signal {}: {}", signal, ec.message());
    }

    impl_->waitForSignal();
    impl_->thread = std::thread{[impl = impl_.get()]() {
        impl->context.run();
    }};
}

InterruptWatcher::~InterruptWatcher()
{
    impl_->context.stop();
    if (impl_->thread.joinable())
        impl_->thread.join();

    // Restores the default handling of the signals.
    boost::system::error_code ec;
    impl_->signals.clear(ec);
}

std::optional<int> InterruptWatcher::received() const
{
    const int signal = impl_->received;
    if (signal == 0)
        return std::nullopt;
    return signal;
}
