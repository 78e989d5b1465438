#include "dispatcher.hpp"

#include <boost/asio/post.hpp>

namespace blob_sync {

void InlineDispatcher::post(std::function<void()> fn) {
    fn();
}

AsioDispatcher::AsioDispatcher(boost::asio::io_context& ioc)
    : mIoc(ioc) {}

void AsioDispatcher::post(std::function<void()> fn) {
    boost::asio::post(mIoc, std::move(fn));
}

} // namespace blob_sync
