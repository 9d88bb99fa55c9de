#include "sandbox/container.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <signal.h>
#include <fmt/core.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace quizjudge {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

const size_t LOG_FRAME_ALLOWANCE = 64 * 1024;

size_t write_response(char *ptr, size_t size, size_t nmemb, void *userdata) {
    auto *sink = static_cast<response_sink *>(userdata);
    size_t count = size * nmemb;
    if (sink->limit > 0 && sink->body->size() + count > sink->limit) {
        sink->body->append(ptr, sink->limit - sink->body->size());
        sink->truncated = true;
        return 0;
    }
    sink->body->append(ptr, count);
    return count;
}

/**
 * @brief 取出容器引擎返回的错误信息
 */
static string engine_message(const http_response &response) {
    try {
        auto j = json::parse(response.body);
        if (j.is_object() && j.count("message") && j.at("message").is_string())
            return j.at("message").get<string>();
    } catch (json::exception &) {
        // 不是 JSON，直接返回原文
    }
    return response.body;
}

container_engine::container_engine(const string &socket_path, const string &api_version)
    : socket_path(socket_path), api_version(api_version) {}

container_engine::~container_engine() = default;

http_response container_engine::request(const string &method, const string &path, const string &body,
                                        double timeout, size_t body_limit) const {
    http_response response;
    response_sink sink{&response.body, body_limit};
    CURL *curl = curl_easy_init();
    if (!curl) throw sandbox_unavailable_error("unable to initialize curl");
    struct curl_slist *headers = nullptr;
    defer {
        curl_slist_free_all(headers);
        curl_easy_cleanup(curl);
    };

    string url = "http://localhost/" + api_version + path;
    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_response);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &sink);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, 5000L);
    if (method == "POST") {
        headers = curl_slist_append(headers, "Content-Type: application/json");
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    }
    if (timeout > 0)
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)(timeout * 1000));

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OPERATION_TIMEDOUT) {
        response.timed_out = true;
        return response;
    }
    // 写回调拒绝了超出限制的数据，已经收到的部分仍然有效
    if (res == CURLE_WRITE_ERROR && sink.truncated)
        response.truncated = true;
    else if (res != CURLE_OK)
        throw sandbox_unavailable_error(fmt::format("Unable to reach container engine at {}: {}", socket_path, curl_easy_strerror(res)));
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

void container_engine::ping() const {
    auto response = request("GET", "/_ping", "", 5);
    if (response.timed_out || response.status_code != 200)
        throw sandbox_unavailable_error(fmt::format("Container engine at {} is not responding", socket_path));
}

bool container_engine::has_image(const string &image) const {
    auto response = request("GET", "/images/" + image + "/json", "", 10);
    if (response.timed_out)
        throw sandbox_unavailable_error("Timed out inspecting image " + image);
    if (response.status_code == 200) return true;
    if (response.status_code == 404) return false;
    throw sandbox_unavailable_error(fmt::format("Unable to inspect image {}: {}", image, engine_message(response)));
}

string container_engine::create_container(const string &name, const json &config) const {
    auto response = request("POST", "/containers/create?name=" + name, config.dump(), 30);
    if (response.timed_out)
        throw sandbox_unavailable_error("Timed out creating container");
    if (response.status_code == 404)
        throw sandbox_unavailable_error(fmt::format("Docker image {} not available: {}", config.value("Image", ""), engine_message(response)));
    if (response.status_code != 201)
        throw sandbox_unavailable_error(fmt::format("Unable to create container ({}): {}", response.status_code, engine_message(response)));
    try {
        return json::parse(response.body).at("Id").get<string>();
    } catch (json::exception &ex) {
        throw sandbox_unavailable_error(fmt::format("Unexpected response creating container: {}", ex.what()));
    }
}

void container_engine::start_container(const string &id) const {
    auto response = request("POST", "/containers/" + id + "/start", "", 30);
    if (response.timed_out)
        throw sandbox_unavailable_error("Timed out starting container " + id);
    if (response.status_code != 204 && response.status_code != 304)
        throw sandbox_unavailable_error(fmt::format("Unable to start container ({}): {}", response.status_code, engine_message(response)));
}

optional<int> container_engine::wait_container(const string &id, double timeout) const {
    auto response = request("POST", "/containers/" + id + "/wait?condition=not-running", "", timeout);
    if (response.timed_out) return nullopt;
    if (response.status_code != 200)
        throw sandbox_unavailable_error(fmt::format("Unable to wait for container ({}): {}", response.status_code, engine_message(response)));
    try {
        return json::parse(response.body).at("StatusCode").get<int>();
    } catch (json::exception &ex) {
        throw sandbox_unavailable_error(fmt::format("Unexpected response waiting for container: {}", ex.what()));
    }
}

void container_engine::kill_container(const string &id) const {
    auto response = request("POST", "/containers/" + id + "/kill", "", 10);
    // 409 表示容器已经停止
    if (response.timed_out || (response.status_code != 204 && response.status_code != 404 && response.status_code != 409))
        LOG(WARNING) << "Unable to kill container " << id << ": " << engine_message(response);
}

string container_engine::container_logs(const string &id, size_t limit, bool &truncated) const {
    auto response = request("GET", "/containers/" + id + "/logs?stdout=1&stderr=1", "", 30, limit);
    if (response.timed_out || response.status_code != 200)
        throw sandbox_unavailable_error(fmt::format("Unable to fetch logs of container {}: {}", id, engine_message(response)));
    truncated = response.truncated;
    return response.body;
}

void container_engine::remove_container(const string &id) const {
    auto response = request("DELETE", "/containers/" + id + "?force=1&v=1", "", 30);
    if (response.timed_out || (response.status_code != 204 && response.status_code != 404))
        LOG(ERROR) << "Unable to remove container " << id << ": " << engine_message(response);
}

const string &container_engine::socket() const {
    return socket_path;
}

void demultiplex_logs(const string &raw, execution_result &result, size_t limit) {
    size_t pos = 0;
    while (pos + 8 <= raw.size()) {
        unsigned char stream = raw[pos];
        size_t size = ((size_t)(unsigned char)raw[pos + 4] << 24) |
                      ((size_t)(unsigned char)raw[pos + 5] << 16) |
                      ((size_t)(unsigned char)raw[pos + 6] << 8) |
                      (size_t)(unsigned char)raw[pos + 7];
        pos += 8;
        size_t available = min(size, raw.size() - pos);
        if (stream == 2)
            append_limited(result.error, raw.data() + pos, available, limit, result.truncated);
        else
            append_limited(result.output, raw.data() + pos, available, limit, result.truncated);
        pos += available;
    }
}

container_runner::container_runner(const container_engine &engine, const string &image, const string &mount_dir)
    : engine(engine), image(image), mount_dir(mount_dir) {}

string container_runner::type() const {
    return "container";
}

json container_runner::make_config(const workspace &ws, const vector<string> &command, const sandbox_limits &limits) const {
    string bind = fs::absolute(ws.path).string() + ":" + mount_dir + ":rw";
    return {
        {"Image", image},
        {"Cmd", command},
        {"WorkingDir", mount_dir},
        {"Tty", false},
        {"OpenStdin", false},
        {"AttachStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"NetworkDisabled", limits.network_disabled},
        {"Env", json::array({"PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"})},
        {"Labels", json::object({{"quizjudge.workspace", ws.id}})},
        {"HostConfig", {
            {"Binds", json::array({bind})},
            {"Memory", limits.memory_limit},
            {"MemorySwap", limits.memory_limit},
            {"CpuPeriod", limits.cpu_period},
            {"CpuQuota", limits.cpu_quota},
            {"NetworkMode", limits.network_disabled ? "none" : "default"},
            {"PidsLimit", 64},
            {"CapDrop", json::array({"ALL"})},
            {"SecurityOpt", json::array({"no-new-privileges"})},
            {"AutoRemove", false}
        }}
    };
}

execution_result container_runner::run(const workspace &ws, const vector<string> &command, const sandbox_limits &limits) const {
    string id = engine.create_container("quizjudge-" + ws.id, make_config(ws, command, limits));
    // 无论运行结果如何，容器都必须被删除
    defer { engine.remove_container(id); };

    DLOG(INFO) << "Created container " << id << " for workspace " << ws.path;
    engine.start_container(id);

    execution_result result;
    elapsed_time timer;
    auto exitcode = engine.wait_container(id, limits.wall_time_limit);
    result.wall_time = timer.seconds();
    if (exitcode) {
        result.exitcode = *exitcode;
    } else {
        LOG(WARNING) << "Container " << id << " exceeded wall time limit " << limits.wall_time_limit << "s, killing";
        result.timed_out = true;
        result.exitcode = 128 + SIGKILL;
        engine.kill_container(id);
    }

    // stdout 和 stderr 各自最多保留 output_limit 字节，另外为帧头留出余量
    bool logs_truncated = false;
    string logs = engine.container_logs(id, 2 * limits.output_limit + LOG_FRAME_ALLOWANCE, logs_truncated);
    demultiplex_logs(logs, result, limits.output_limit);
    if (logs_truncated) result.truncated = true;
    if (result.truncated)
        LOG(INFO) << "Output of container " << id << " truncated at " << limits.output_limit << " bytes";
    return result;
}

}  // namespace quizjudge
