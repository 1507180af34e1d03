/**
 * RoomRegistryClient: REST client for the signaling mailbox.
 *
 * Uses libcurl's easy interface, one handle per request. The registry
 * answers JSON on every path, including errors (`{"error": "..."}`).
 */

#include "registry/room_registry_client.h"

#include <cctype>
#include <memory>
#include <utility>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace {

size_t append_body(char* data, size_t size, size_t count, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(data, size * count);
    return size * count;
}

std::int64_t read_int(const json& j, const char* key) {
    const auto it = j.find(key);
    if (it == j.end() || it->is_null()) return 0;
    if (it->is_number()) return it->get<std::int64_t>();
    if (it->is_string()) return std::stoll(it->get<std::string>());
    throw RegistryError(std::string("room record field ") + key + " is not a number", 0);
}

template <typename T>
T field(const json& j, const char* key, T fallback) {
    try {
        return j.value(key, fallback);
    } catch (const json::exception& ex) {
        throw RegistryError(std::string("registry field ") + key + " is malformed: " + ex.what(), 0);
    }
}

bool is_success(long status) {
    return status >= 200 && status < 300;
}

json parse_body(const std::string& body, long status) {
    const json j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        throw RegistryError("registry returned an unreadable body (HTTP " + std::to_string(status) + ")",
                            status);
    }
    return j;
}

[[noreturn]] void raise_for_status(const json& body, long status) {
    std::string message = "HTTP " + std::to_string(status);
    if (body.is_object() && body.contains("error") && body.at("error").is_string()) {
        message = body.at("error").get<std::string>();
    }
    throw RegistryError(message, status);
}

json expect_ok(long status, const std::string& body) {
    const json j = parse_body(body, status);
    if (!is_success(status)) raise_for_status(j, status);
    if (!j.is_object()) throw RegistryError("registry reply is not an object", status);
    return j;
}

} // namespace

void from_json(const json& j, RoomRecord& record) {
    record.room_id = field<std::string>(j, "room_id", "");
    record.host_offer = field<std::string>(j, "host_offer", "");
    record.guest_answer = field<std::string>(j, "guest_answer", "");
    record.tool_type = field<std::string>(j, "tool_type", "");
    try {
        record.created_at = read_int(j, "created_at");
        record.ttl = read_int(j, "ttl");
    } catch (const std::logic_error& ex) {
        throw RegistryError(std::string("room record has a malformed timestamp: ") + ex.what(), 0);
    }
}

bool is_valid_room_id(const std::string& room_id) {
    if (room_id.size() != 8) return false;
    for (const char c : room_id) {
        const auto uc = static_cast<unsigned char>(c);
        if (!std::isdigit(uc) && !(c >= 'A' && c <= 'Z')) return false;
    }
    return true;
}

RoomRegistryClient::RoomRegistryClient(RegistryConfig config)
    : config_(std::move(config)) {}

CreatedRoom RoomRegistryClient::create_room(const std::string& room_id, const std::string& host_offer) {
    const auto response = http_post(config_.rooms_path,
                                    {{"room_id", room_id}, {"host_offer", host_offer}});
    const json j = expect_ok(response.status, response.body);

    CreatedRoom created;
    created.room_id = field<std::string>(j, "room_id", room_id);
    created.message = field<std::string>(j, "message", "");
    spdlog::info("Registered room {}", created.room_id);
    return created;
}

RoomCheck RoomRegistryClient::check_room(const std::string& room_id) {
    const auto response = http_get(room_endpoint(room_id, "/check"));

    RoomCheck check;
    if (response.status == 404) return check;

    const json j = expect_ok(response.status, response.body);
    check.exists = field<bool>(j, "exists", false);
    if (check.exists && j.contains("room") && j.at("room").is_object()) {
        check.room = j.at("room").get<RoomRecord>();
    }
    return check;
}

RoomRecord RoomRegistryClient::get_room_data(const std::string& room_id) {
    const auto response = http_get(room_endpoint(room_id, ""));
    return expect_ok(response.status, response.body).get<RoomRecord>();
}

std::string RoomRegistryClient::update_room_offer(const std::string& room_id,
                                                  const std::string& host_offer) {
    const auto response = http_put(room_endpoint(room_id, "/offer"), {{"host_offer", host_offer}});
    return field<std::string>(expect_ok(response.status, response.body), "message", "");
}

std::string RoomRegistryClient::update_room_answer(const std::string& room_id,
                                                   const std::string& guest_answer) {
    const auto response = http_put(room_endpoint(room_id, "/answer"), {{"guest_answer", guest_answer}});
    return field<std::string>(expect_ok(response.status, response.body), "message", "");
}

RoomRegistryClient::HttpResponse RoomRegistryClient::http_get(const std::string& endpoint) {
    return perform("GET", config_.base_url + endpoint, "");
}

RoomRegistryClient::HttpResponse RoomRegistryClient::http_post(const std::string& endpoint,
                                                               const json& body) {
    return perform("POST", config_.base_url + endpoint, body.dump());
}

RoomRegistryClient::HttpResponse RoomRegistryClient::http_put(const std::string& endpoint,
                                                              const json& body) {
    return perform("PUT", config_.base_url + endpoint, body.dump());
}

std::string RoomRegistryClient::room_endpoint(const std::string& room_id,
                                              const std::string& suffix) const {
    if (!is_valid_room_id(room_id)) {
        throw std::invalid_argument("invalid room id: " + room_id);
    }
    return config_.rooms_path + "/" + room_id + suffix;
}

RoomRegistryClient::HttpResponse RoomRegistryClient::perform(const std::string& method,
                                                            const std::string& url,
                                                            const std::string& body) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw RegistryError("curl_easy_init failed", 0);

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, "Content-Type: application/json"), &curl_slist_free_all);

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, config_.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, &append_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    if (method == "POST" || method == "PUT") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    spdlog::debug("{} {}", method, url);
    const CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        throw RegistryError(std::string("registry request failed: ") + curl_easy_strerror(rc), 0);
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}
