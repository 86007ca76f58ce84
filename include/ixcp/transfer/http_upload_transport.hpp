#pragma once

#include "ixcp/network/http_client.hpp"
#include "ixcp/network/http_router.hpp"
#include "ixcp/transfer/transport.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace ixcp::transfer {

/**
 * @brief UploadTransport speaking the receiver's HTTP protocol
 *
 * Builds the requests, maps responses back to results and leaves the
 * actual exchange to send(). Status mapping:
 *
 *   2xx         success
 *   401 / 403   AuthenticationRejected
 *   400 / 422   PayloadRejected
 *   404         NotFound
 *   408 / 429   TransientTransport
 *   409         IncompleteTransfer
 *   5xx         TransientTransport
 *
 * Exchange failures from send() are passed through unchanged.
 */
class RestUploadTransport : public UploadTransport {
public:
    explicit RestUploadTransport(std::string api_key);

    Result<crypto::PublicKeyRecord> fetch_public_key() override;
    Result<ChunkAck> upload_chunk(const EncryptedPacket& packet) override;
    Result<std::vector<std::uint32_t>> query_status(const std::string& file_key) override;
    Result<FinalizedFile> finalize(const std::string& file_key,
                                   std::uint32_t total_chunks,
                                   const std::string& session_id) override;
    Result<void> discard(const std::string& file_key) override;

    /// Error for a non-2xx response.
    static Error error_for(const network::HttpResponse& response);

protected:
    virtual Result<network::HttpResponse> send(network::HttpRequest request) = 0;

private:
    network::HttpRequest authorized(network::HttpMethod method, std::string url) const;
    Result<nlohmann::json> exchange_json(network::HttpRequest request);

    std::string api_key_;
};

/**
 * @brief RestUploadTransport over a real TCP connection
 */
class HttpUploadTransport final : public RestUploadTransport {
public:
    HttpUploadTransport(network::HttpClient client, std::string api_key);

protected:
    Result<network::HttpResponse> send(network::HttpRequest request) override;

private:
    network::HttpClient client_;
};

/**
 * @brief RestUploadTransport that hands requests straight to a router
 *
 * Used by tests and the resume demo to run client and receiver in one
 * process. A fault injector may fail selected requests before they reach
 * the router, which is how network outages are simulated.
 */
class LoopbackTransport final : public RestUploadTransport {
public:
    /// Returns an error to fail the request, nullopt to let it through.
    using FaultInjector = std::function<std::optional<Error>(const network::HttpRequest&)>;

    LoopbackTransport(const network::HttpRouter& router, std::string api_key);

    void set_fault_injector(FaultInjector injector);

protected:
    Result<network::HttpResponse> send(network::HttpRequest request) override;

private:
    const network::HttpRouter& router_;
    std::mutex mutex_;
    FaultInjector injector_;
};

} // namespace ixcp::transfer
