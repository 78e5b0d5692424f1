#ifndef STREAMGATE_CLIENT_H
#define STREAMGATE_CLIENT_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <boost/system/error_code.hpp>
#include <streamgate/async.h>
#include <streamgate/exceptions.h>

namespace streamgate {

    struct CaseInsensitiveCompare {
        bool operator()(const std::string& a, const std::string& b) const {
            return std::lexicographical_compare(
                a.begin(), a.end(), b.begin(), b.end(),
                [](unsigned char c1, unsigned char c2) { return std::tolower(c1) < std::tolower(c2); }
            );
        }
    };

    using HeaderMap = std::multimap<std::string, std::string, CaseInsensitiveCompare>;

    struct UpstreamRequest {
        std::string method = "GET";
        std::string target = "/";
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    };

    struct UpstreamResponse {
        int status = 0;
        std::string body;
        HeaderMap headers;

        // Get first value
        std::string get_header(const std::string& key) const {
            auto it = headers.find(key);
            if (it != headers.end()) return it->second;
            return "";
        }
    };

    struct ParsedUrl {
        std::string host;
        std::string port;
        std::string target;
        bool is_ssl = false;
    };

    ParsedUrl parse_url(const std::string& url);

    /**
     * @brief Maps an Asio/Beast error from one step of an outbound exchange
     * onto a TransportError kind. @p where names the step for the message.
     */
    TransportError classify_transport_error(const boost::system::error_code& ec, const std::string& where);

    /**
     * @brief Outbound HTTP seam used by the load balancer and the health prober.
     *
     * Implementations throw TransportError for anything that prevents a complete
     * response from arriving; a response with any status code is returned as is.
     */
    class HttpClient {
    public:
        virtual ~HttpClient() = default;

        /**
         * @param base_url Endpoint address, e.g. http://10.0.0.4:3002
         * @param request Method, target (path and query) and headers to send.
         */
        virtual Async<UpstreamResponse> send(const std::string& base_url, UpstreamRequest request) = 0;
    };

    /**
     * @brief Boost.Beast client. One connection per call, HTTPS via OpenSSL,
     * the whole exchange (resolve included) bounded by request.timeout.
     */
    class BeastHttpClient : public HttpClient {
    public:
        Async<UpstreamResponse> send(const std::string& base_url, UpstreamRequest request) override;
    };

} // namespace streamgate

#endif // STREAMGATE_CLIENT_H
