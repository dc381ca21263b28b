/**
 * @file media_client.cpp
 * @brief Implementation of the media upload client
 */

#include "kcenon/media_uploader/client/media_client.h"

#include "kcenon/media_uploader/core/logging.h"
#include "kcenon/media_uploader/request/network_http_transport.h"

namespace kcenon::media_uploader {

struct media_client::impl {
    client_config config;
    request_signer signer;

    explicit impl(client_config cfg)
        : config(std::move(cfg)),
          signer(config.signer) {}
};

// builder implementation
media_client::builder::builder() = default;

auto media_client::builder::with_host(std::string host) -> builder& {
    config_.host = std::move(host);
    return *this;
}

auto media_client::builder::with_auth(std::string key, std::string secret) -> builder& {
    config_.signer.auth_key = std::move(key);
    config_.signer.auth_secret = std::move(secret);
    return *this;
}

auto media_client::builder::with_signing(bool enable) -> builder& {
    config_.signer.signing_enabled = enable;
    return *this;
}

auto media_client::builder::with_signature_expiry(std::chrono::seconds expiry) -> builder& {
    config_.signer.expiry_duration = expiry;
    return *this;
}

auto media_client::builder::with_retry_policy(retry_policy policy) -> builder& {
    config_.retry = std::move(policy);
    return *this;
}

auto media_client::builder::with_max_parallel_uploads(std::size_t count) -> builder& {
    config_.max_parallel_uploads = count;
    return *this;
}

auto media_client::builder::with_chunk_size(std::size_t size) -> builder& {
    config_.chunk_size = size;
    return *this;
}

auto media_client::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto media_client::builder::with_resuming(bool enable) -> builder& {
    config_.resuming_enabled = enable;
    return *this;
}

auto media_client::builder::with_url_store(std::shared_ptr<url_store> store) -> builder& {
    config_.store = std::move(store);
    return *this;
}

auto media_client::builder::with_transport(
    std::shared_ptr<http_transport_interface> transport) -> builder& {
    config_.transport = std::move(transport);
    return *this;
}

auto media_client::builder::build() -> result<media_client> {
    auto valid = config_.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    if (!config_.store) {
        config_.store = std::make_shared<memory_url_store>();
    }
    if (!config_.transport) {
        config_.transport = make_network_http_transport(config_.request_timeout);
    }

    return media_client{std::move(config_)};
}

// media_client implementation
media_client::media_client(client_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();

    MU_LOG_DEBUG(log_category::client,
        "Client created for " + impl_->config.host + " (" + client_identifier() + ")");
}

media_client::media_client(media_client&&) noexcept = default;
auto media_client::operator=(media_client&&) noexcept -> media_client& = default;
media_client::~media_client() = default;

auto media_client::request() const -> retrying_http_client {
    return retrying_http_client(impl_->config.transport, impl_->signer, impl_->config.host,
                                impl_->config.retry);
}

auto media_client::new_batch(std::shared_ptr<upload_listener> listener) const
    -> std::unique_ptr<upload_coordinator> {
    coordinator_options options;
    options.max_parallel_uploads = impl_->config.max_parallel_uploads;
    options.chunk_size = impl_->config.chunk_size;
    options.resuming_enabled = impl_->config.resuming_enabled;
    return new_batch(std::move(listener), std::move(options));
}

auto media_client::new_batch(std::shared_ptr<upload_listener> listener,
                             coordinator_options options) const
    -> std::unique_ptr<upload_coordinator> {
    return std::make_unique<upload_coordinator>(request(), impl_->config.store,
                                                std::move(options), std::move(listener));
}

auto media_client::config() const -> const client_config& {
    return impl_->config;
}

auto media_client::store() const -> std::shared_ptr<url_store> {
    return impl_->config.store;
}

auto media_client::client_identifier() -> std::string {
    return retrying_http_client::client_identifier();
}

}  // namespace kcenon::media_uploader
