#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include "sandbox/runner.hpp"

namespace quizjudge {

struct http_response {
    long status_code = 0;
    std::string body;

    /**
     * @brief 请求是否因为超时而中断
     */
    bool timed_out = false;

    /**
     * @brief 响应体是否因为超出 body_limit 而被截断
     */
    bool truncated = false;
};

/**
 * @brief 接收响应体的缓冲区，作为 curl 写回调的上下文
 * 超出 limit 后不再接收数据，curl 随之以 CURLE_WRITE_ERROR 中断传输
 */
struct response_sink {
    std::string *body;

    /**
     * @brief 最多接收的字节数，0 表示不限制
     */
    size_t limit = 0;

    bool truncated = false;
};

/**
 * @brief curl 的 CURLOPT_WRITEFUNCTION 回调，userdata 为 response_sink
 * @return 接收的字节数，超出限制时返回 0 以中断传输
 */
size_t write_response(char *ptr, size_t size, size_t nmemb, void *userdata);

/**
 * @brief 容器引擎客户端，通过 UNIX 套接字访问 Docker Engine API
 * 客户端只保存连接参数，每个请求使用独立的 curl 句柄，因此可以被多个评测线程同时使用。
 * 必须在 curl_global_init 之后使用。
 */
struct container_engine {
    /**
     * @param socket_path 容器引擎监听的 UNIX 套接字，比如 /var/run/docker.sock
     * @param api_version API 版本前缀，比如 v1.41
     */
    explicit container_engine(const std::string &socket_path, const std::string &api_version = "v1.41");
    virtual ~container_engine();

    /**
     * @brief 检查容器引擎是否可以访问
     * @throw sandbox_unavailable_error 若容器引擎无法访问
     */
    virtual void ping() const;

    /**
     * @brief 检查本地是否存在镜像
     */
    virtual bool has_image(const std::string &image) const;

    /**
     * @brief 创建容器
     * @param config 容器配置，见 Docker Engine API 的 ContainerCreate
     * @return 容器 id
     * @throw sandbox_unavailable_error 若镜像不存在或者创建失败
     */
    virtual std::string create_container(const std::string &name, const nlohmann::json &config) const;

    virtual void start_container(const std::string &id) const;

    /**
     * @brief 等待容器退出
     * @param timeout 最长等待时间，单位为秒
     * @return 容器的返回值，超时时返回空
     */
    virtual std::optional<int> wait_container(const std::string &id, double timeout) const;

    virtual void kill_container(const std::string &id) const;

    /**
     * @brief 获取容器的 stdout 和 stderr 输出
     * 选手程序可以在时间限制内写出任意多的日志，下载时最多保留 limit 字节
     * @param limit 最多下载的字节数
     * @param truncated 日志流被截断时设为 true
     * @return 容器引擎返回的多路复用日志流，需要通过 demultiplex_logs 拆分
     */
    virtual std::string container_logs(const std::string &id, size_t limit, bool &truncated) const;

    /**
     * @brief 强制删除容器，容器不存在时什么也不做
     */
    virtual void remove_container(const std::string &id) const;

    /**
     * @brief 发送 HTTP 请求
     * @param timeout 超时时间，单位为秒，0 表示不限制
     * @param body_limit 响应体最多保留的字节数，0 表示不限制
     * @throw sandbox_unavailable_error 若无法连接容器引擎
     */
    http_response request(const std::string &method, const std::string &path, const std::string &body = "",
                          double timeout = 0, size_t body_limit = 0) const;

    const std::string &socket() const;

private:
    std::string socket_path;
    std::string api_version;
};

/**
 * @brief 拆分容器引擎的多路复用日志流
 * 每一帧以 8 字节的头部开始：第 1 字节为流编号（1 为 stdout，2 为 stderr），
 * 第 5 到 8 字节为大端序的帧长度。
 * @param raw 日志流
 * @param result 拆分结果写入 output 和 error，超出 limit 的部分被丢弃
 */
void demultiplex_logs(const std::string &raw, execution_result &result, size_t limit);

/**
 * @brief 下载容器日志时为帧头预留的字节数
 */
extern const size_t LOG_FRAME_ALLOWANCE;

/**
 * @brief 在一次性容器中运行评测脚本
 * 工作目录以读写方式挂载到容器内的 mount_dir，容器运行结束后无论成功与否都会被删除
 */
struct container_runner : public sandbox_runner {
    container_runner(const container_engine &engine, const std::string &image, const std::string &mount_dir = "/app");

    std::string type() const override;

    execution_result run(const workspace &ws, const std::vector<std::string> &command, const sandbox_limits &limits) const override;

    /**
     * @brief 生成创建容器的配置
     */
    nlohmann::json make_config(const workspace &ws, const std::vector<std::string> &command, const sandbox_limits &limits) const;

private:
    const container_engine &engine;
    std::string image;
    std::string mount_dir;
};

}  // namespace quizjudge
