/*
 * tesla_api.cpp
 *
 * Bridge Tesla Owner API ↔ Local Mosquitto
 * Copyright (c) 2026 The tesla-mqtt-bridge authors
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */

#include "tesla_bridge/tesla_api.hpp"
#include "tesla_bridge/log.hpp"
#include "tesla_bridge/strings.hpp"
#include "tesla_bridge/vehicle_data.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>
#include <fcntl.h>
#include <unistd.h>

namespace tesla_bridge {

using json = nlohmann::json;

// ===================== file helpers =====================

static std::string read_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return {};
    std::ostringstream ss; ss << f.rdbuf();
    return ss.str();
}

[[noreturn]] static void token_io_error(const std::string& what, const std::string& path){
    throw VehicleError(VehicleError::Kind::Auth, what + " " + path + ": " + std::strerror(errno));
}

// ===================== HTTP =====================

struct HttpResponse {
    long status = 0;
    std::string body;
};

static size_t curl_write_cb(void* ptr, size_t size, size_t nmemb, void* userdata){
    auto* s = static_cast<std::string*>(userdata);
    s->append(static_cast<const char*>(ptr), size*nmemb);
    return size*nmemb;
}

// Throws VehicleError(Transport) when the request never got an HTTP answer.
static HttpResponse http_request(const std::string& method,
                                 const std::string& url,
                                 const std::string& bearer,
                                 const std::string& json_body,
                                 long timeout_s)
{
    HttpResponse resp;

    CURL* c = curl_easy_init();
    if(!c){
        throw VehicleError(VehicleError::Kind::Transport, "curl_easy_init failed");
    }

    struct curl_slist* hdrs = nullptr;
    hdrs = curl_slist_append(hdrs, "Accept: application/json");
    if(!bearer.empty()){
        hdrs = curl_slist_append(hdrs, ("Authorization: Bearer " + bearer).c_str());
    }
    if(method == "POST"){
        hdrs = curl_slist_append(hdrs, "Content-Type: application/json");
        curl_easy_setopt(c, CURLOPT_POST, 1L);
        curl_easy_setopt(c, CURLOPT_POSTFIELDS, json_body.c_str());
        curl_easy_setopt(c, CURLOPT_POSTFIELDSIZE, (long)json_body.size());
    }

    curl_easy_setopt(c, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c, CURLOPT_HTTPHEADER, hdrs);
    curl_easy_setopt(c, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(c, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L); // threadsafe timeouts
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(c, CURLOPT_WRITEDATA, &resp.body);
    curl_easy_setopt(c, CURLOPT_USERAGENT, "tesla-mqtt-bridge/1.0");

    CURLcode rc = curl_easy_perform(c);
    if (rc != CURLE_OK) {
        std::string err = curl_easy_strerror(rc);
        curl_slist_free_all(hdrs);
        curl_easy_cleanup(c);
        throw VehicleError(VehicleError::Kind::Transport, method + " " + url + ": " + err);
    }
    curl_easy_getinfo(c, CURLINFO_RESPONSE_CODE, &resp.status);

    curl_slist_free_all(hdrs);
    curl_easy_cleanup(c);

    TB_LOG_DEBUG("http", method << " " << url << " -> " << resp.status << " bytes=" << resp.body.size());
    return resp;
}

// ===================== session =====================

namespace {

class TeslaSession : public VehicleSession {
public:
    TeslaSession(const TeslaApiConfig& config, std::string access_token)
        : config_(config), access_token_(std::move(access_token)) {}

    ~TeslaSession() override {
        TB_LOG_DEBUG("api", "session closed for " << config_.email);
    }

    std::vector<VehicleInfo> vehicle_list() override {
        return parse_vehicle_list(get("/api/1/vehicles", "vehicle_list"));
    }

    VehicleSummary vehicle_summary(const VehicleInfo& v) override {
        return parse_vehicle_summary(get("/api/1/vehicles/" + v.id, "get_vehicle_summary"));
    }

    VehicleSnapshot vehicle_data(const VehicleInfo& v) override {
        return parse_vehicle_data(get("/api/1/vehicles/" + v.id + "/vehicle_data", "get_vehicle_data"));
    }

    void set_charge_limit(const VehicleInfo& v, int percent) override {
        command(v, "set_charge_limit", json{{"percent", percent}});
    }

    void charge_start(const VehicleInfo& v) override {
        command(v, "charge_start", json::object());
    }

    void charge_stop(const VehicleInfo& v) override {
        command(v, "charge_stop", json::object());
    }

private:
    json get(const std::string& path, const std::string& what){
        HttpResponse r = http_request("GET", config_.api_base + path, access_token_, "", config_.timeout_s);
        return decode_response(r.status, r.body, what);
    }

    void command(const VehicleInfo& v, const std::string& name, const json& params){
        std::string path = "/api/1/vehicles/" + v.id + "/command/" + name;
        HttpResponse r = http_request("POST", config_.api_base + path, access_token_,
                                      params.dump(), config_.timeout_s);
        check_command_result(decode_response(r.status, r.body, name), name);
    }

    TeslaApiConfig config_;
    std::string access_token_;
};

} // namespace

// ===================== API =====================

TeslaApi::TeslaApi(TeslaApiConfig config) : config_(std::move(config)) {}

std::string TeslaApi::refresh_token_path() const {
    return (std::filesystem::path(config_.token_dir) / "refresh_token.txt").string();
}

void write_token_file(const std::string& path, const std::string& data){
    namespace fs = std::filesystem;

    fs::path dir = fs::path(path).parent_path();
    if(dir.empty()) dir = ".";
    std::error_code ec;
    fs::create_directories(dir, ec);

    // mkstemp creates the file 0600
    std::string tmp = path + ".tmp.XXXXXX";
    int fd = ::mkstemp(tmp.data());
    if(fd < 0) token_io_error("mkstemp", tmp);

    const char* p = data.data();
    size_t left = data.size();
    while(left > 0){
        ssize_t n = ::write(fd, p, left);
        if(n < 0 && errno == EINTR) continue;
        if(n < 0){
            int saved = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            errno = saved;
            token_io_error("write", tmp);
        }
        left -= (size_t)n;
        p += n;
    }
    int synced = ::fsync(fd);
    int saved = errno;
    if(::close(fd) != 0 && synced == 0){
        synced = -1;
        saved = errno;
    }
    if(synced != 0){
        ::unlink(tmp.c_str());
        errno = saved;
        token_io_error("fsync", tmp);
    }
    if(::rename(tmp.c_str(), path.c_str()) != 0){
        saved = errno;
        ::unlink(tmp.c_str());
        errno = saved;
        token_io_error("rename", path);
    }

    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
    if(dfd >= 0){
        (void)::fsync(dfd);
        ::close(dfd);
    }
}

std::unique_ptr<VehicleSession> TeslaApi::open_session(){
    const std::string rt_path = refresh_token_path();
    std::string cur_refresh = trim_copy(read_file(rt_path));
    if (cur_refresh.empty()) {
        throw VehicleError(VehicleError::Kind::Auth, rt_path + " missing/empty");
    }

    TB_LOG_INFO("auth", "token refresh for " << config_.email);
    json body = {
        {"grant_type",    "refresh_token"},
        {"client_id",     "ownerapi"},
        {"refresh_token", cur_refresh},
        {"scope",         "openid email offline_access"},
    };
    HttpResponse r = http_request("POST", config_.auth_url, "", body.dump(), config_.timeout_s);

    if (r.status != 200) {
        throw VehicleError(VehicleError::Kind::Auth,
                           "token refresh HTTP " + std::to_string(r.status) + ": " + r.body.substr(0, 200));
    }

    json j = json::parse(r.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        throw VehicleError(VehicleError::Kind::Auth, "token refresh: invalid JSON");
    }
    if (j.contains("error") && !j["error"].is_null()) {
        throw VehicleError(VehicleError::Kind::Auth, "token refresh failed: " + j["error"].dump());
    }

    std::string new_acc = j.contains("access_token") && j["access_token"].is_string()
                        ? trim_copy(j["access_token"].get<std::string>()) : std::string();
    std::string new_rt  = j.contains("refresh_token") && j["refresh_token"].is_string()
                        ? trim_copy(j["refresh_token"].get<std::string>()) : std::string();
    if (new_acc.empty()) {
        throw VehicleError(VehicleError::Kind::Auth, "token refresh: no access_token in response");
    }

    if (!new_rt.empty() && new_rt != cur_refresh) {
        write_token_file(rt_path, new_rt + "\n");
        TB_LOG_INFO("auth", "rotated refresh token saved");
    }

    long expires_in = j.contains("expires_in") && j["expires_in"].is_number() ? j["expires_in"].get<long>() : 0L;
    TB_LOG_INFO("auth", "access token valid for " << expires_in << "s");
    return std::make_unique<TeslaSession>(config_, new_acc);
}

} // namespace tesla_bridge
