#include "chain/ChainRpcClient.hpp"
#include "ledger/Errors.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <iostream>
#include <thread>

using namespace yieldguard;
using json = nlohmann::json;

ChainRpcClient::ChainRpcClient(const std::string& rpc_url) : url_(rpc_url) {
    curl_ = curl_easy_init();
    if (!curl_) throw CollaboratorUnavailable("[RPC] curl_easy_init failed");
    std::cout << "[RPC] Endpoint " << url_ << "\n";
}

ChainRpcClient::~ChainRpcClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    // curl_global_cleanup() belongs to main(), after every handle is gone.
}

size_t ChainRpcClient::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* out = reinterpret_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

std::string ChainRpcClient::perform(const std::string& body) {
    std::string response;
    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl_, CURLOPT_URL,            url_.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER,     headers);
    curl_easy_setopt(curl_, CURLOPT_POST,           1L);
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDS,     body.c_str());
    curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE,  static_cast<long>(body.size()));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION,  write_cb);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA,      &response);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT,        10L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 5L);

    // Public RPC endpoints rate-limit and drop connections. 3 attempts,
    // 200ms / 400ms backoff.
    static constexpr int MAX_RETRIES = 3;
    for (int attempt = 0; attempt < MAX_RETRIES; ++attempt) {
        response.clear();
        CURLcode res = curl_easy_perform(curl_);
        if (res == CURLE_OK) {
            long status = 0;
            curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &status);
            if (status == 200) {
                curl_slist_free_all(headers);
                return response;
            }
            std::cout << "[RPC] HTTP " << status << " (attempt " << (attempt + 1)
                      << "/" << MAX_RETRIES << ")\n";
        } else {
            std::cout << "[RPC] Retry " << (attempt + 1) << "/" << MAX_RETRIES
                      << " (" << curl_easy_strerror(res) << ")\n";
        }
        if (attempt < MAX_RETRIES - 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200 * (1 << attempt)));
        }
    }

    curl_slist_free_all(headers);
    throw CollaboratorUnavailable("[RPC] " + url_ + " failed after retries");
}

json ChainRpcClient::call(const std::string& method, const json& params) {
    std::lock_guard<std::mutex> lock(mtx_);

    json req;
    req["jsonrpc"] = "2.0";
    req["method"]  = method;
    req["params"]  = params;
    req["id"]      = next_id_++;

    std::string raw = perform(req.dump());

    json resp;
    try {
        resp = json::parse(raw);
    } catch (const json::exception& e) {
        throw CollaboratorUnavailable(std::string("[RPC] Unparseable response: ") + e.what());
    }
    if (resp.contains("error")) {
        throw CollaboratorUnavailable("[RPC] " + method + " error: " + resp["error"].dump());
    }
    if (!resp.contains("result")) {
        throw CollaboratorUnavailable("[RPC] " + method + " response without result");
    }
    return resp["result"];
}

std::string ChainRpcClient::balance_of_calldata(const std::string& holder) {
    std::string addr = holder;
    if (addr.size() >= 2 && addr[0] == '0' && (addr[1] == 'x' || addr[1] == 'X')) {
        addr = addr.substr(2);
    }
    std::transform(addr.begin(), addr.end(), addr.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (addr.size() > 64) {
        throw ValidationError("address too long: " + holder);
    }
    return "0x70a08231" + std::string(64 - addr.size(), '0') + addr;
}

double ChainRpcClient::hex_to_units(const std::string& hex, int decimals) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }

    // uint256 does not fit any integer type; long double keeps ~18 significant
    // digits, plenty for a balance report.
    long double raw = 0.0L;
    for (char c : digits) {
        int v;
        if (c >= '0' && c <= '9')      v = c - '0';
        else if (c >= 'a' && c <= 'f') v = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') v = c - 'A' + 10;
        else throw ValidationError("bad hex quantity: " + hex);
        raw = raw * 16.0L + v;
    }
    return static_cast<double>(raw / std::pow(10.0L, decimals));
}

double ChainRpcClient::erc20_balance(const std::string& token,
                                     const std::string& holder,
                                     int decimals) {
    json call_obj;
    call_obj["to"]   = token;
    call_obj["data"] = balance_of_calldata(holder);

    json result = call("eth_call", json::array({call_obj, "latest"}));
    if (!result.is_string()) {
        throw CollaboratorUnavailable("[RPC] eth_call returned non-string result");
    }
    try {
        return hex_to_units(result.get<std::string>(), decimals);
    } catch (const ValidationError& e) {
        throw CollaboratorUnavailable(std::string("[RPC] ") + e.what());
    }
}
