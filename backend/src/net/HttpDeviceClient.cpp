#include "net/HttpDeviceClient.hpp"
#include "net/LightProtocol.hpp"
#include "core/ErrorCatalog.hpp"
#include <curl/curl.h>

namespace keylightd {

static size_t write_cb(void* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* resp = static_cast<std::string*>(userdata);
    resp->append(static_cast<char*>(ptr), size * nmemb);
    return size * nmemb;
}

HttpDeviceClient::HttpDeviceClient(std::chrono::milliseconds timeout) : timeout_(timeout) {
    // Constructed once from main() before any lane thread exists.
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpDeviceClient::~HttpDeviceClient() {
    curl_global_cleanup();
}

HttpDeviceClient::HttpResult HttpDeviceClient::perform(const std::string& method, const std::string& url, const std::string* payload) const {
    HttpResult out;
    CURL* curl = curl_easy_init();
    if (!curl) {
        out.transport_error = "curl_easy_init failed";
        return out;
    }
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &out.body);
    // Required with multiple threads; timeouts must not rely on SIGALRM.
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout_.count()));

    if (method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
        if (payload) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, payload->c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->size()));
        }
    }

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK) {
        out.transport_ok = true;
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &out.code);
    } else {
        out.transport_error = curl_easy_strerror(res);
    }

    // clear the header option on the easy handle before freeing the list
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);
    return out;
}

std::optional<Error> HttpDeviceClient::classify(const HttpResult& r, const std::string& url) {
    if (!r.transport_ok) {
        return errors::make_error(ErrorKind::Unreachable, url + ": " + r.transport_error);
    }
    if (r.code >= 400) {
        std::string detail = "HTTP " + std::to_string(r.code);
        if (!r.body.empty()) detail += ": " + r.body;
        return errors::make_error(ErrorKind::Rejected, detail);
    }
    if (r.code < 200 || r.code >= 300) {
        return errors::make_error(ErrorKind::ProtocolError, "unexpected HTTP status " + std::to_string(r.code));
    }
    return std::nullopt;
}

Result<LightState> HttpDeviceClient::send(const Address& address, const Command& cmd) {
    const std::string url = protocol::lights_url(address);
    HttpResult r;
    if (cmd.op == Operation::Query) {
        r = perform("GET", url, nullptr);
    } else {
        const std::string payload = protocol::encode_command(cmd).dump();
        r = perform("PUT", url, &payload);
    }
    if (auto err = classify(r, url)) return *err;
    return protocol::decode_lights(r.body);
}

Result<DeviceInfo> HttpDeviceClient::identify(const Address& address) {
    const std::string url = protocol::accessory_info_url(address);
    HttpResult r = perform("GET", url, nullptr);
    if (auto err = classify(r, url)) return *err;
    return protocol::decode_accessory_info(r.body);
}

} // namespace keylightd
