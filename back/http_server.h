#ifndef HTTP_SERVER_H
#define HTTP_SERVER_H

#include "restock_engine.h"
#include <string>
#include <memory>
#include <map>
#include <atomic>
#include <thread>
#include <optional>
#include <mutex>
#include <vector>
#include <set>
#include <chrono>

// 路由处理结果（不含传输层细节）
struct HttpResponse {
    int status_code;
    std::string body;
    std::string content_type;

    HttpResponse() : status_code(200), content_type("application/json") {}
    HttpResponse(int status, const std::string& content, const std::string& type = "application/json")
        : status_code(status), body(content), content_type(type) {}
};

// 简单的HTTP服务器，提供补货引擎的 REST API
class HttpServer {
public:
    HttpServer(int port, std::shared_ptr<RestockEngine> engine, int64_t low_stock_default_days = 5);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();

    // 关闭监听套接字，中断未读完的请求并等待所有连接线程退出
    void stop();

    bool isRunning() const { return running_.load(); }
    int getPort() const { return port_; }
    int activeConnections() const { return active_connections_.load(); }

    // 读取一个完整请求的总时限，超时按畸形请求处理
    void setRequestTimeout(std::chrono::milliseconds timeout) { request_timeout_ms_ = timeout.count(); }

    // 处理一条已解析的请求；target 可带查询串，如 "/api/inventory/low-stock?threshold_days=3"
    HttpResponse handleRequest(const std::string& method, const std::string& target, const std::string& body);

    // ========== JSON 工具 ==========

    // 提取顶层字段：字符串返回反转义后的内容，其余返回原始文本；字段缺失或为 null 时返回 std::nullopt
    static std::optional<std::string> jsonField(const std::string& json, const std::string& key);
    static std::string escapeJson(const std::string& str);
    static std::string urlDecode(const std::string& str);
    static std::map<std::string, std::string> parseQuery(const std::string& query);

private:
    int port_;
    std::atomic<bool> running_;
    std::atomic<int> server_fd_;
    std::atomic<int> active_connections_;
    std::thread accept_thread_;
    std::shared_ptr<RestockEngine> engine_;
    int64_t low_stock_default_days_;
    std::atomic<int64_t> request_timeout_ms_;

    // 连接线程由服务器持有，stop() 时全部 join
    struct ClientWorker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };
    std::mutex clients_mutex_;
    std::vector<ClientWorker> client_workers_;
    std::set<int> client_sockets_;

    void acceptLoop();
    void reapFinishedClients();
    void handleClient(int client_socket);
    bool readRequest(int client_socket, std::string& method, std::string& target, std::string& body);

    HttpResponse route(const std::string& method, const std::string& path,
                       const std::map<std::string, std::string>& query, const std::string& body);

    // ========== API端点处理方法 ==========

    HttpResponse handleListItems(const std::map<std::string, std::string>& query);
    HttpResponse handleCreateItem(const std::string& body);
    HttpResponse handleGetItem(const std::string& item_id);
    HttpResponse handleUpdateItem(const std::string& item_id, const std::string& body);
    HttpResponse handleRemoveItem(const std::string& item_id);
    HttpResponse handleRecordUsage(const std::string& item_id, const std::string& body);
    HttpResponse handleLowStock(const std::map<std::string, std::string>& query);
    HttpResponse handleSweep(SweepMode mode);
    HttpResponse handleCreateRequest(const std::string& body);
    HttpResponse handleListRequests(const std::map<std::string, std::string>& query);
    HttpResponse handleGetRequest(const std::string& request_id);
    HttpResponse handleUpdateRequest(const std::string& request_id, const std::string& body);
    HttpResponse handleSystemStatus();
    HttpResponse handleMetrics(const std::map<std::string, std::string>& query);

    // ========== JSON 序列化方法 ==========

    std::string itemToJson(const Item& item) const;
    std::string forecastToJson(const Forecast& forecast) const;
    std::string requestToJson(const RestockRequest& request) const;
    std::string sweepReportToJson(const SweepReport& report) const;

    // ========== 工具方法 ==========

    template<typename T>
    HttpResponse errorFromResult(const Result<T>& result) const;

    HttpResponse createErrorResponse(ErrorCode code, const std::string& message) const;
    static int statusForError(ErrorCode code);
    static std::string createHttpResponse(const HttpResponse& response);
    static std::string statusText(int status_code);
};

#endif // HTTP_SERVER_H
