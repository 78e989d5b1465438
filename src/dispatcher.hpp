#pragma once

#include <boost/asio/io_context.hpp>

#include <functional>

namespace blob_sync {

/// The single context on which user-visible completions are delivered.
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    virtual void post(std::function<void()> fn) = 0;
};

/// Runs every posted function immediately on the calling thread.
class InlineDispatcher : public Dispatcher {
public:
    void post(std::function<void()> fn) override;
};

/// Queues posted functions onto an io_context; they run on whichever thread
/// calls ioc.run(). The io_context must outlive the dispatcher.
class AsioDispatcher : public Dispatcher {
public:
    explicit AsioDispatcher(boost::asio::io_context& ioc);

    void post(std::function<void()> fn) override;

private:
    boost::asio::io_context& mIoc;
};

} // namespace blob_sync
