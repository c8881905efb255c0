#include "http_server.h"
#include "logger.h"
#include "error_handling.h"
#include "monitoring.h"
#include <sstream>
#include <chrono>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include <iterator>
#include <cctype>
#include <regex>
#include <iomanip>

namespace {

const size_t MAX_HEADER_BYTES = 16 * 1024;
const size_t MAX_BODY_BYTES = 1024 * 1024;

const char* const CORS_HEADERS =
    "Access-Control-Allow-Origin: *\r\n"
    "Access-Control-Allow-Methods: GET, POST, PUT, DELETE, OPTIONS\r\n"
    "Access-Control-Allow-Headers: Content-Type, Authorization\r\n";

bool parseInt64(const std::string& text, int64_t& value) {
    try {
        size_t pos = 0;
        long long parsed = std::stoll(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseUint64(const std::string& text, uint64_t& value) {
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return false;
    }
    try {
        value = std::stoull(text);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parseDouble(const std::string& text, double& value) {
    try {
        size_t pos = 0;
        double parsed = std::stod(text, &pos);
        if (pos != text.size()) {
            return false;
        }
        value = parsed;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

void appendUtf8(std::string& out, unsigned int code_point) {
    if (code_point < 0x80) {
        out += static_cast<char>(code_point);
    } else if (code_point < 0x800) {
        out += static_cast<char>(0xC0 | (code_point >> 6));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else if (code_point < 0x10000) {
        out += static_cast<char>(0xE0 | (code_point >> 12));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (code_point >> 18));
        out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (code_point & 0x3F));
    }
}

size_t skipJsonWhitespace(const std::string& json, size_t pos) {
    while (pos < json.size() && (json[pos] == ' ' || json[pos] == '\t' || json[pos] == '\r' || json[pos] == '\n')) {
        ++pos;
    }
    return pos;
}

// \uXXXX 的四位十六进制，pos 指向第一位
bool parseHex4(const std::string& json, size_t pos, unsigned int& value) {
    if (pos + 4 > json.size()) {
        return false;
    }
    value = 0;
    for (size_t i = pos; i < pos + 4; ++i) {
        unsigned char c = static_cast<unsigned char>(json[i]);
        if (!std::isxdigit(c)) {
            return false;
        }
        value = value * 16 + static_cast<unsigned int>(std::isdigit(c) ? c - '0' : std::tolower(c) - 'a' + 10);
    }
    return true;
}

// pos 指向开头引号；成功时 pos 移到结尾引号之后
bool parseJsonString(const std::string& json, size_t& pos, std::string& out) {
    if (pos >= json.size() || json[pos] != '"') {
        return false;
    }

    out.clear();
    for (size_t i = pos + 1; i < json.size(); ++i) {
        char c = json[i];
        if (c == '"') {
            pos = i + 1;
            return true;
        }
        if (c != '\\') {
            out += c;
            continue;
        }
        if (i + 1 >= json.size()) {
            return false;
        }

        char next = json[++i];
        switch (next) {
            case '"': out += '"'; break;
            case '\\': out += '\\'; break;
            case '/': out += '/'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u': {
                unsigned int code_point = 0;
                if (!parseHex4(json, i + 1, code_point)) {
                    return false;
                }
                i += 4;
                // 代理对必须成对出现并合成一个码点
                if (code_point >= 0xD800 && code_point <= 0xDBFF) {
                    unsigned int low = 0;
                    if (i + 2 >= json.size() || json[i + 1] != '\\' || json[i + 2] != 'u' ||
                        !parseHex4(json, i + 3, low) || low < 0xDC00 || low > 0xDFFF) {
                        return false;
                    }
                    code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                    i += 6;
                } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
                    return false;
                }
                appendUtf8(out, code_point);
                break;
            }
            default:
                return false;
        }
    }
    return false;  // 未闭合的字符串
}

// 跳过一个 JSON 值，返回其后的位置；格式错误时返回 npos
size_t skipJsonValue(const std::string& json, size_t pos) {
    if (pos >= json.size()) {
        return std::string::npos;
    }

    if (json[pos] == '"') {
        std::string ignored;
        return parseJsonString(json, pos, ignored) ? pos : std::string::npos;
    }

    if (json[pos] == '{' || json[pos] == '[') {
        int depth = 0;
        for (size_t i = pos; i < json.size(); ++i) {
            char c = json[i];
            if (c == '"') {
                std::string ignored;
                if (!parseJsonString(json, i, ignored)) {
                    return std::string::npos;
                }
                --i;
            } else if (c == '{' || c == '[') {
                ++depth;
            } else if (c == '}' || c == ']') {
                if (--depth == 0) {
                    return i + 1;
                }
            }
        }
        return std::string::npos;
    }

    size_t end = json.find_first_of(",}] \t\r\n", pos);
    return end == std::string::npos ? json.size() : end;
}

bool looksLikeJsonObject(const std::string& body) {
    size_t begin = body.find_first_not_of(" \t\r\n");
    size_t end = body.find_last_not_of(" \t\r\n");
    return begin != std::string::npos && body[begin] == '{' && body[end] == '}';
}

std::string optionalInt(const std::optional<int64_t>& value) {
    return value ? std::to_string(*value) : "null";
}

} // namespace

HttpServer::HttpServer(int port, std::shared_ptr<RestockEngine> engine, int64_t low_stock_default_days)
    : port_(port)
    , running_(false)
    , server_fd_(-1)
    , active_connections_(0)
    , engine_(engine)
    , low_stock_default_days_(low_stock_default_days)
    , request_timeout_ms_(10000) {
    LOG_INFO("HttpServer", "constructor", "HTTP Server initialized on port " + std::to_string(port));
}

HttpServer::~HttpServer() {
    stop();
}

template<typename T>
HttpResponse HttpServer::errorFromResult(const Result<T>& result) const {
    return createErrorResponse(result.getErrorCode(), result.getErrorMessage());
}

bool HttpServer::start() {
    if (running_) {
        LOG_WARNING("HttpServer", "start", "Server is already running");
        return false;
    }

    LOG_INFO("HttpServer", "start", "Starting HTTP server on port " + std::to_string(port_));

    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd == -1) {
        ErrorHandler::logError(ErrorCode::SOCKET_CREATE_FAILED, strerror(errno),
                               ERROR_CONTEXT("HttpServer", "start"));
        return false;
    }

    // 设置socket选项，允许地址重用
    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_WARNING("HttpServer", "start", "Failed to set SO_REUSEADDR: " + std::string(strerror(errno)));
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port_);

    if (bind(server_fd, (struct sockaddr*)&address, sizeof(address)) < 0) {
        ErrorHandler::logError(ErrorCode::SOCKET_BIND_FAILED,
                               "Port " + std::to_string(port_) + ": " + strerror(errno),
                               ERROR_CONTEXT("HttpServer", "start"));
        close(server_fd);
        return false;
    }

    // 端口 0 时由内核分配，记录实际端口
    if (port_ == 0) {
        socklen_t length = sizeof(address);
        if (getsockname(server_fd, (struct sockaddr*)&address, &length) == 0) {
            port_ = ntohs(address.sin_port);
        }
    }

    if (listen(server_fd, 64) < 0) {
        ErrorHandler::logError(ErrorCode::SOCKET_LISTEN_FAILED, strerror(errno),
                               ERROR_CONTEXT("HttpServer", "start"));
        close(server_fd);
        return false;
    }

    server_fd_ = server_fd;
    running_ = true;
    accept_thread_ = std::thread(&HttpServer::acceptLoop, this);

    LOG_INFO("HttpServer", "start", "HTTP server started successfully");
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // 关闭监听套接字使 accept() 返回
    int fd = server_fd_.exchange(-1);
    if (fd != -1) {
        shutdown(fd, SHUT_RDWR);
        close(fd);
    }

    if (accept_thread_.joinable()) {
        accept_thread_.join();
    }

    // 关闭读端使阻塞在 recv() 的连接立即返回，已在处理的请求仍可写回响应
    std::vector<ClientWorker> workers;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        for (int client_socket : client_sockets_) {
            shutdown(client_socket, SHUT_RD);
        }
        workers.swap(client_workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    LOG_INFO("HttpServer", "stop", "HTTP server stopped");
}

// ========== 连接处理 ==========

void HttpServer::acceptLoop() {
    while (running_) {
        struct sockaddr_in client_address;
        socklen_t client_len = sizeof(client_address);

        int client_socket = accept(server_fd_.load(), (struct sockaddr*)&client_address, &client_len);
        if (client_socket < 0) {
            if (!running_) {
                break;
            }
            if (errno != EINTR) {
                LOG_ERROR("HttpServer", "accept", "Failed to accept connection: " + std::string(strerror(errno)));
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            continue;
        }

        reapFinishedClients();

        // 处理客户端请求（在新线程中）
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_sockets_.insert(client_socket);
        active_connections_++;
        auto finished = std::make_shared<std::atomic<bool>>(false);
        ClientWorker worker;
        worker.finished = finished;
        worker.thread = std::thread([this, client_socket, finished]() {
            handleClient(client_socket);
            active_connections_--;
            finished->store(true);
        });
        client_workers_.push_back(std::move(worker));
    }
}

void HttpServer::reapFinishedClients() {
    std::vector<ClientWorker> done;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = std::partition(client_workers_.begin(), client_workers_.end(),
                                 [](const ClientWorker& worker) { return !worker.finished->load(); });
        std::move(it, client_workers_.end(), std::back_inserter(done));
        client_workers_.erase(it, client_workers_.end());
    }
    for (auto& worker : done) {
        worker.thread.join();
    }
}

void HttpServer::handleClient(int client_socket) {
    std::string method, target, body;
    std::string response;

    if (readRequest(client_socket, method, target, body)) {
        response = createHttpResponse(handleRequest(method, target, body));
    } else {
        response = createHttpResponse(createErrorResponse(ErrorCode::HTTP_PARSE_ERROR, "Malformed HTTP request"));
    }

    size_t sent = 0;
    while (sent < response.size()) {
        ssize_t n = send(client_socket, response.data() + sent, response.size() - sent, MSG_NOSIGNAL);
        if (n <= 0) {
            LOG_DEBUG("HttpServer", "response", "Client closed connection before response was sent");
            break;
        }
        sent += static_cast<size_t>(n);
    }

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        client_sockets_.erase(client_socket);
    }
    close(client_socket);
}

bool HttpServer::readRequest(int client_socket, std::string& method, std::string& target, std::string& body) {
    std::string request;
    char buffer[4096];

    // SO_RCVTIMEO 只限制单次 recv()，逐字节发送的慢客户端由总时限截断
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(request_timeout_ms_.load());
    auto receive = [&]() -> ssize_t {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            LOG_WARNING("HttpServer", "readRequest", "Request not completed within the read deadline");
            return -1;
        }
        // 剩余时间向上取整，避免得到表示"永不超时"的 0
        auto remaining = std::chrono::ceil<std::chrono::microseconds>(deadline - now);
        struct timeval timeout;
        timeout.tv_sec = static_cast<time_t>(remaining.count() / 1000000);
        timeout.tv_usec = static_cast<suseconds_t>(remaining.count() % 1000000);
        if (setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0) {
            LOG_WARNING("HttpServer", "readRequest", "Failed to set receive timeout: " + std::string(strerror(errno)));
            return -1;
        }
        return recv(client_socket, buffer, sizeof(buffer), 0);
    };

    size_t header_end = std::string::npos;
    while (header_end == std::string::npos) {
        ssize_t bytes_read = receive();
        if (bytes_read <= 0) {
            return false;
        }
        request.append(buffer, static_cast<size_t>(bytes_read));
        header_end = request.find("\r\n\r\n");
        if (header_end == std::string::npos && request.size() > MAX_HEADER_BYTES) {
            return false;
        }
    }

    // 解析请求行
    std::istringstream request_stream(request.substr(0, header_end));
    std::string version;
    request_stream >> method >> target >> version;
    if (method.empty() || target.empty() || !version.starts_with("HTTP/")) {
        return false;
    }

    // 按 Content-Length 读取完整请求体
    size_t content_length = 0;
    std::string header_line;
    std::getline(request_stream, header_line);
    while (std::getline(request_stream, header_line)) {
        size_t colon = header_line.find(':');
        if (colon == std::string::npos) continue;
        if (toLower(header_line.substr(0, colon)) == "content-length") {
            int64_t length = 0;
            std::string value = header_line.substr(colon + 1);
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t\r") + 1);
            if (!parseInt64(value, length) || length < 0 || static_cast<size_t>(length) > MAX_BODY_BYTES) {
                return false;
            }
            content_length = static_cast<size_t>(length);
        }
    }

    body = request.substr(header_end + 4);
    while (body.size() < content_length) {
        ssize_t bytes_read = receive();
        if (bytes_read <= 0) {
            return false;
        }
        body.append(buffer, static_cast<size_t>(bytes_read));
    }
    if (body.size() > content_length) {
        body.resize(content_length);
    }

    return true;
}

// ========== 路由 ==========

HttpResponse HttpServer::handleRequest(const std::string& method, const std::string& target, const std::string& body) {
    auto start_time = std::chrono::steady_clock::now();
    HttpResponse response;

    try {
        if (method == "OPTIONS") {
            // CORS 预检
            response = HttpResponse(200, "");
        } else {
            size_t query_start = target.find('?');
            std::string path = target.substr(0, query_start);
            std::map<std::string, std::string> query;
            if (query_start != std::string::npos) {
                query = parseQuery(target.substr(query_start + 1));
            }
            response = route(method, path, query, body);
        }
    } catch (const std::exception& e) {
        LOG_ERROR("HttpServer", "handleRequest", "Exception: " + std::string(e.what()));
        auto failure = ErrorHandler::fromException<void>(e, ERROR_CONTEXT("HttpServer", "handleRequest"));
        response = createErrorResponse(failure.getErrorCode(), "Internal server error");
    }

    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start_time);

    static const char* const known_methods[] = {"GET", "POST", "PUT", "DELETE", "OPTIONS"};
    std::string metric_method = "OTHER";
    for (const char* known : known_methods) {
        if (method == known) {
            metric_method = known;
        }
    }
    RECORD_HTTP_REQUEST(metric_method, response.status_code, duration.count() / 1000.0);

    LOG_DEBUG("HttpServer", "handleRequest",
              method + " " + target + " -> " + std::to_string(response.status_code));
    return response;
}

HttpResponse HttpServer::route(const std::string& method, const std::string& path,
                               const std::map<std::string, std::string>& query, const std::string& body) {
    static const std::regex item_pattern(R"(^/api/items/([^/]+)$)");
    static const std::regex usage_pattern(R"(^/api/items/([^/]+)/usage$)");
    static const std::regex request_pattern(R"(^/api/restock-requests/([^/]+)$)");
    std::smatch matches;

    auto methodNotAllowed = [this, &method, &path]() {
        return createErrorResponse(ErrorCode::HTTP_METHOD_NOT_ALLOWED, method + " not allowed on " + path);
    };

    if (path == "/api/items") {
        if (method == "GET") return handleListItems(query);
        if (method == "POST") return handleCreateItem(body);
        return methodNotAllowed();
    }

    if (std::regex_match(path, matches, usage_pattern)) {
        if (method == "POST") return handleRecordUsage(urlDecode(matches[1].str()), body);
        return methodNotAllowed();
    }

    if (std::regex_match(path, matches, item_pattern)) {
        std::string item_id = urlDecode(matches[1].str());
        if (method == "GET") return handleGetItem(item_id);
        if (method == "PUT") return handleUpdateItem(item_id, body);
        if (method == "DELETE") return handleRemoveItem(item_id);
        return methodNotAllowed();
    }

    if (path == "/api/inventory/low-stock") {
        if (method == "GET") return handleLowStock(query);
        return methodNotAllowed();
    }

    if (path == "/api/inventory/restock-preview") {
        if (method == "GET") return handleSweep(SweepMode::PREVIEW);
        return methodNotAllowed();
    }

    if (path == "/api/inventory/auto-restock-check") {
        if (method == "POST") return handleSweep(SweepMode::COMMIT);
        return methodNotAllowed();
    }

    if (path == "/api/restock-requests") {
        if (method == "GET") return handleListRequests(query);
        if (method == "POST") return handleCreateRequest(body);
        return methodNotAllowed();
    }

    if (std::regex_match(path, matches, request_pattern)) {
        std::string request_id = urlDecode(matches[1].str());
        if (method == "GET") return handleGetRequest(request_id);
        if (method == "PUT") return handleUpdateRequest(request_id, body);
        return methodNotAllowed();
    }

    if (path == "/api/system/status") {
        if (method == "GET") return handleSystemStatus();
        return methodNotAllowed();
    }

    if (path == "/api/system/metrics") {
        if (method == "GET") return handleMetrics(query);
        return methodNotAllowed();
    }

    return createErrorResponse(ErrorCode::HTTP_ROUTE_NOT_FOUND, "Endpoint not found: " + path);
}

// ========== 物品 ==========

HttpResponse HttpServer::handleListItems(const std::map<std::string, std::string>& query) {
    auto it = query.find("facility_id");
    auto items = engine_->listItems(it != query.end() ? it->second : "");

    std::ostringstream json;
    json << "{\"items\":[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) json << ",";
        json << itemToJson(items[i]);
    }
    json << "],\"count\":" << items.size() << "}";
    return HttpResponse(200, json.str());
}

HttpResponse HttpServer::handleCreateItem(const std::string& body) {
    if (!looksLikeJsonObject(body)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "Request body must be a JSON object");
    }

    Item item;
    auto id = jsonField(body, "item_id");
    if (!id) id = jsonField(body, "id");
    item.id = id.value_or("");
    item.name = jsonField(body, "name").value_or("");
    item.category = jsonField(body, "category").value_or("");
    item.unit = jsonField(body, "unit").value_or("");
    item.facility_id = jsonField(body, "facility_id").value_or("");
    item.facility_name = jsonField(body, "facility_name").value_or("");

    auto stock = jsonField(body, "current_stock");
    if (stock && !parseInt64(*stock, item.current_stock)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "current_stock must be an integer");
    }

    auto usage = jsonField(body, "daily_usage");
    if (!usage) usage = jsonField(body, "daily_consumption_rate");
    if (usage && !parseDouble(*usage, item.daily_usage)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "daily_usage must be a number");
    }

    auto result = engine_->addItem(item);
    if (result.isError()) {
        return errorFromResult(result);
    }
    return HttpResponse(201, itemToJson(result.getValue()));
}

HttpResponse HttpServer::handleGetItem(const std::string& item_id) {
    auto item = engine_->getItem(item_id);
    if (!item) {
        return createErrorResponse(ErrorCode::ITEM_NOT_FOUND, "Item not found: " + item_id);
    }
    return HttpResponse(200, itemToJson(*item));
}

HttpResponse HttpServer::handleUpdateItem(const std::string& item_id, const std::string& body) {
    if (!looksLikeJsonObject(body)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "Request body must be a JSON object");
    }

    ItemPatch patch;
    patch.name = jsonField(body, "name");
    patch.category = jsonField(body, "category");
    patch.unit = jsonField(body, "unit");
    patch.facility_id = jsonField(body, "facility_id");
    patch.facility_name = jsonField(body, "facility_name");

    if (auto stock = jsonField(body, "current_stock")) {
        int64_t value = 0;
        if (!parseInt64(*stock, value)) {
            return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "current_stock must be an integer");
        }
        patch.current_stock = value;
    }

    auto usage = jsonField(body, "daily_usage");
    if (!usage) usage = jsonField(body, "daily_consumption_rate");
    if (usage) {
        double value = 0.0;
        if (!parseDouble(*usage, value)) {
            return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "daily_usage must be a number");
        }
        patch.daily_usage = value;
    }

    auto result = engine_->updateItem(item_id, patch);
    if (result.isError()) {
        return errorFromResult(result);
    }
    return HttpResponse(200, itemToJson(result.getValue()));
}

HttpResponse HttpServer::handleRemoveItem(const std::string& item_id) {
    auto result = engine_->removeItem(item_id);
    if (result.isError()) {
        return errorFromResult(result);
    }
    return HttpResponse(200, "{\"removed\":\"" + escapeJson(item_id) + "\"}");
}

HttpResponse HttpServer::handleRecordUsage(const std::string& item_id, const std::string& body) {
    if (!looksLikeJsonObject(body)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "Request body must be a JSON object");
    }

    auto used_text = jsonField(body, "quantity_used");
    int64_t used = 0;
    if (!used_text || !parseInt64(*used_text, used)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "quantity_used must be an integer");
    }

    auto result = engine_->recordUsage(item_id, used);
    if (result.isError()) {
        return errorFromResult(result);
    }
    return HttpResponse(200, itemToJson(result.getValue()));
}

// ========== 库存查询与巡检 ==========

HttpResponse HttpServer::handleLowStock(const std::map<std::string, std::string>& query) {
    int64_t threshold = low_stock_default_days_;
    auto threshold_it = query.find("threshold_days");
    if (threshold_it != query.end() && !parseInt64(threshold_it->second, threshold)) {
        return createErrorResponse(ErrorCode::INVALID_PARAMETER, "threshold_days must be an integer");
    }

    auto facility_it = query.find("facility_id");
    auto result = engine_->lowStock(threshold, facility_it != query.end() ? facility_it->second : "");
    if (result.isError()) {
        return errorFromResult(result);
    }

    const auto& entries = result.getValue();
    std::ostringstream json;
    json << "{\"threshold_days\":" << threshold << ",\"items\":[";
    for (size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) json << ",";
        json << itemToJson(entries[i].item);
    }
    json << "],\"count\":" << entries.size() << "}";
    return HttpResponse(200, json.str());
}

HttpResponse HttpServer::handleSweep(SweepMode mode) {
    SweepReport report = mode == SweepMode::COMMIT ? engine_->autoRestockCheck() : engine_->previewRestock();
    return HttpResponse(200, sweepReportToJson(report));
}

// ========== 补货请求 ==========

HttpResponse HttpServer::handleCreateRequest(const std::string& body) {
    if (!looksLikeJsonObject(body)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "Request body must be a JSON object");
    }

    ManualRestockRequest request;
    request.item_id = jsonField(body, "item_id").value_or("");
    request.comments = jsonField(body, "comments").value_or("");

    auto quantity = jsonField(body, "quantity");
    if (!quantity) quantity = jsonField(body, "quantity_needed");
    if (quantity) {
        int64_t value = 0;
        if (!parseInt64(*quantity, value)) {
            return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "quantity must be an integer");
        }
        request.quantity = value;
    }

    if (auto priority = jsonField(body, "priority")) {
        RequestPriority value;
        if (!parsePriority(*priority, value)) {
            return createErrorResponse(ErrorCode::INVALID_PARAMETER, "priority must be Critical, High or Normal");
        }
        request.priority = value;
    }

    auto result = engine_->requestRestock(request);
    if (result.isError()) {
        return errorFromResult(result);
    }
    return HttpResponse(201, requestToJson(result.getValue()));
}

HttpResponse HttpServer::handleListRequests(const std::map<std::string, std::string>& query) {
    std::optional<RequestStatus> status;
    auto status_it = query.find("status");
    if (status_it != query.end() && !status_it->second.empty()) {
        RequestStatus value;
        if (!parseStatus(status_it->second, value)) {
            return createErrorResponse(ErrorCode::INVALID_PARAMETER, "Unknown status: " + status_it->second);
        }
        status = value;
    }

    auto facility_it = query.find("facility_id");
    auto requests = engine_->listRequests(status, facility_it != query.end() ? facility_it->second : "");

    std::ostringstream json;
    json << "{\"requests\":[";
    for (size_t i = 0; i < requests.size(); ++i) {
        if (i > 0) json << ",";
        json << requestToJson(requests[i]);
    }
    json << "],\"count\":" << requests.size() << "}";
    return HttpResponse(200, json.str());
}

HttpResponse HttpServer::handleGetRequest(const std::string& request_id) {
    uint64_t id = 0;
    if (!parseUint64(request_id, id)) {
        return createErrorResponse(ErrorCode::INVALID_PARAMETER, "Request ID must be a positive integer");
    }

    auto request = engine_->getRequest(id);
    if (!request) {
        return createErrorResponse(ErrorCode::REQUEST_NOT_FOUND, "Restock request not found: " + request_id);
    }
    return HttpResponse(200, requestToJson(*request));
}

HttpResponse HttpServer::handleUpdateRequest(const std::string& request_id, const std::string& body) {
    uint64_t id = 0;
    if (!parseUint64(request_id, id)) {
        return createErrorResponse(ErrorCode::INVALID_PARAMETER, "Request ID must be a positive integer");
    }
    if (!looksLikeJsonObject(body)) {
        return createErrorResponse(ErrorCode::JSON_PARSE_ERROR, "Request body must be a JSON object");
    }

    auto action = jsonField(body, "action");
    if (!action) action = jsonField(body, "status");
    if (!action) {
        return createErrorResponse(ErrorCode::INVALID_PARAMETER, "Missing action (approve, decline or fulfill)");
    }

    auto comments = jsonField(body, "comments");
    std::string verb = toLower(*action);

    Result<RestockRequest> result = RESULT_ERROR(RestockRequest, ErrorCode::INVALID_PARAMETER,
                                                 "Unknown action: " + *action,
                                                 ERROR_CONTEXT("HttpServer", "handleUpdateRequest"));
    if (verb == "approve" || verb == "approved") {
        result = engine_->approveRequest(id, comments);
    } else if (verb == "decline" || verb == "declined") {
        result = engine_->declineRequest(id, comments);
    } else if (verb == "fulfill" || verb == "fulfilled") {
        result = engine_->fulfillRequest(id, comments);
    }

    if (result.isError()) {
        return errorFromResult(result);
    }
    return HttpResponse(200, requestToJson(result.getValue()));
}

// ========== 系统 ==========

HttpResponse HttpServer::handleSystemStatus() {
    auto status = engine_->getSystemStatus();
    auto health = MONITOR().getHealthStatus();

    std::ostringstream json;
    json << "{";
    json << "\"status\":\"" << health.status << "\",";
    json << "\"healthy\":" << (health.healthy ? "true" : "false") << ",";
    json << "\"items\":" << status.total_items << ",";
    json << "\"requests\":" << status.total_requests << ",";
    json << "\"open_requests\":" << status.open_requests << ",";
    json << "\"pending_requests\":" << status.pending_requests << ",";
    json << "\"approved_requests\":" << status.approved_requests << ",";
    json << "\"persistence_enabled\":" << (status.persistence_enabled ? "true" : "false") << ",";
    json << "\"recurring_sweep\":" << (status.recurring_sweep_running ? "true" : "false") << ",";
    json << "\"sweeps_completed\":" << status.sweeps_completed << ",";

    json << "\"issues\":[";
    for (size_t i = 0; i < health.issues.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escapeJson(health.issues[i]) << "\"";
    }
    json << "],";

    auto log_stats = Logger::getInstance().getStatistics();
    json << "\"logging\":{";
    json << "\"total\":" << log_stats.total_logs << ",";
    json << "\"warnings\":" << log_stats.warning_count << ",";
    json << "\"errors\":" << (log_stats.error_count + log_stats.fatal_count) << ",";
    json << "\"uptime_seconds\":" << static_cast<int64_t>(log_stats.uptime_seconds) << ",";
    json << "\"recent_errors\":[";
    auto recent = Logger::getInstance().getRecentErrors(5);
    for (size_t i = 0; i < recent.size(); ++i) {
        if (i > 0) json << ",";
        json << "{\"timestamp\":\"" << escapeJson(recent[i].timestamp) << "\","
             << "\"component\":\"" << escapeJson(recent[i].component) << "\","
             << "\"message\":\"" << escapeJson(recent[i].message) << "\"}";
    }
    json << "]},";

    auto storage = engine_->getStorageInfo();
    if (storage) {
        json << "\"storage\":{";
        json << "\"data_dir\":\"" << escapeJson(storage->data_dir) << "\",";
        json << "\"journal_file_size\":" << storage->journal_file_size << ",";
        json << "\"records_written\":" << storage->records_written << ",";
        json << "\"latest_snapshot\":\"" << escapeJson(storage->latest_snapshot_file) << "\"";
        json << "},";
    }

    json << "\"timestamp\":\"" << currentUtcTimestamp() << "\"";
    json << "}";
    return HttpResponse(200, json.str());
}

HttpResponse HttpServer::handleMetrics(const std::map<std::string, std::string>& query) {
    auto format = query.find("format");
    if (format != query.end() && format->second == "json") {
        return HttpResponse(200, MONITOR().exportJSONFormat());
    }
    return HttpResponse(200, MONITOR().exportPrometheusFormat(), "text/plain; version=0.0.4");
}

// ========== JSON 序列化方法 ==========

std::string HttpServer::forecastToJson(const Forecast& forecast) const {
    std::ostringstream json;
    json << "{";
    if (forecast.has_estimate) {
        json << "\"remaining_days\":" << forecast.remaining_days << ",";
        json << "\"days_remaining\":" << std::fixed << std::setprecision(1) << forecast.exact_days << ",";
    } else {
        json << "\"remaining_days\":null,\"days_remaining\":null,";
    }
    json << "\"urgency\":\"" << urgencyTierToString(forecast.tier) << "\"";
    json << "}";
    return json.str();
}

std::string HttpServer::itemToJson(const Item& item) const {
    std::ostringstream json;
    json << "{";
    json << "\"item_id\":\"" << escapeJson(item.id) << "\",";
    json << "\"name\":\"" << escapeJson(item.name) << "\",";
    json << "\"category\":\"" << escapeJson(item.category) << "\",";
    json << "\"unit\":\"" << escapeJson(item.unit) << "\",";
    json << "\"facility_id\":\"" << escapeJson(item.facility_id) << "\",";
    json << "\"facility_name\":\"" << escapeJson(item.facility_name) << "\",";
    json << "\"current_stock\":" << item.current_stock << ",";
    json << "\"daily_usage\":" << item.daily_usage << ",";
    json << "\"updated_at\":\"" << escapeJson(item.updated_at) << "\",";
    json << "\"forecast\":" << forecastToJson(DepletionForecaster::forecast(item));
    json << "}";
    return json.str();
}

std::string HttpServer::requestToJson(const RestockRequest& request) const {
    std::ostringstream json;
    json << "{";
    json << "\"request_id\":" << request.request_id << ",";
    json << "\"item_id\":\"" << escapeJson(request.item_id) << "\",";
    json << "\"item_name\":\"" << escapeJson(request.item_name) << "\",";
    json << "\"facility_id\":\"" << escapeJson(request.facility_id) << "\",";
    json << "\"facility_name\":\"" << escapeJson(request.facility_name) << "\",";
    json << "\"quantity\":" << request.quantity << ",";
    json << "\"priority\":\"" << priorityToString(request.priority) << "\",";
    json << "\"status\":\"" << statusToString(request.status) << "\",";
    json << "\"source\":\"" << sourceToString(request.source) << "\",";
    json << "\"requested_at\":\"" << escapeJson(request.requested_at) << "\",";
    json << "\"updated_at\":\"" << escapeJson(request.updated_at) << "\",";
    json << "\"days_remaining\":" << optionalInt(request.days_remaining) << ",";
    json << "\"comments\":\"" << escapeJson(request.comments) << "\"";
    json << "}";
    return json.str();
}

std::string HttpServer::sweepReportToJson(const SweepReport& report) const {
    std::ostringstream json;
    json << "{";
    json << "\"mode\":\"" << sweepModeToString(report.mode) << "\",";
    json << "\"started_at\":\"" << escapeJson(report.started_at) << "\",";
    json << "\"evaluated\":" << report.evaluated << ",";

    json << "\"created\":[";
    for (size_t i = 0; i < report.created.size(); ++i) {
        if (i > 0) json << ",";
        json << requestToJson(report.created[i]);
    }
    json << "],\"created_count\":" << report.created.size() << ",";

    json << "\"proposed\":[";
    for (size_t i = 0; i < report.proposed.size(); ++i) {
        if (i > 0) json << ",";
        const auto& spec = report.proposed[i];
        json << "{\"item_id\":\"" << escapeJson(spec.item_id) << "\","
             << "\"quantity\":" << spec.quantity << ","
             << "\"priority\":\"" << priorityToString(spec.priority) << "\","
             << "\"days_remaining\":" << optionalInt(spec.days_remaining) << "}";
    }
    json << "],";

    json << "\"skipped\":[";
    for (size_t i = 0; i < report.skipped.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escapeJson(report.skipped[i]) << "\"";
    }
    json << "],";

    json << "\"errors\":[";
    for (size_t i = 0; i < report.errors.size(); ++i) {
        if (i > 0) json << ",";
        json << "\"" << escapeJson(report.errors[i]) << "\"";
    }
    json << "],";

    json << "\"duration_ms\":" << report.duration_ms;
    json << "}";
    return json.str();
}

// ========== JSON 反序列化方法 ==========

std::optional<std::string> HttpServer::jsonField(const std::string& json, const std::string& key) {
    // 只匹配顶层对象的字段，嵌套对象与数组整体跳过
    size_t pos = skipJsonWhitespace(json, 0);
    if (pos >= json.size() || json[pos] != '{') {
        return std::nullopt;
    }
    pos = skipJsonWhitespace(json, pos + 1);

    while (pos < json.size() && json[pos] != '}') {
        std::string name;
        if (!parseJsonString(json, pos, name)) {
            return std::nullopt;
        }
        pos = skipJsonWhitespace(json, pos);
        if (pos >= json.size() || json[pos] != ':') {
            return std::nullopt;
        }
        pos = skipJsonWhitespace(json, pos + 1);

        if (name == key) {
            if (pos < json.size() && json[pos] == '"') {
                std::string value;
                if (!parseJsonString(json, pos, value)) {
                    return std::nullopt;
                }
                return value;
            }
            size_t end = skipJsonValue(json, pos);
            if (end == std::string::npos) {
                return std::nullopt;
            }
            std::string raw = json.substr(pos, end - pos);
            if (raw.empty() || raw == "null") {
                return std::nullopt;
            }
            return raw;
        }

        pos = skipJsonValue(json, pos);
        if (pos == std::string::npos) {
            return std::nullopt;
        }
        pos = skipJsonWhitespace(json, pos);
        if (pos < json.size() && json[pos] == ',') {
            pos = skipJsonWhitespace(json, pos + 1);
        } else if (pos >= json.size() || json[pos] != '}') {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

// ========== 工具方法 ==========

std::string HttpServer::urlDecode(const std::string& str) {
    std::string result;
    for (size_t i = 0; i < str.length(); ++i) {
        if (str[i] == '%' && i + 2 < str.length() &&
            std::isxdigit(static_cast<unsigned char>(str[i + 1])) &&
            std::isxdigit(static_cast<unsigned char>(str[i + 2]))) {
            result += static_cast<char>(std::stoi(str.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (str[i] == '+') {
            result += ' ';
        } else {
            result += str[i];
        }
    }
    return result;
}

std::map<std::string, std::string> HttpServer::parseQuery(const std::string& query) {
    std::map<std::string, std::string> params;
    std::istringstream stream(query);
    std::string pair;
    while (std::getline(stream, pair, '&')) {
        if (pair.empty()) continue;
        size_t eq = pair.find('=');
        if (eq == std::string::npos) {
            params[urlDecode(pair)] = "";
        } else {
            params[urlDecode(pair.substr(0, eq))] = urlDecode(pair.substr(eq + 1));
        }
    }
    return params;
}

int HttpServer::statusForError(ErrorCode code) {
    if (code == ErrorCode::DUPLICATE_ITEM_ID) {
        return 409;
    }
    if (code == ErrorCode::HTTP_METHOD_NOT_ALLOWED) {
        return 405;
    }

    switch (ErrorHandler::errorKind(code)) {
        case ErrorKind::VALIDATION_ERROR: return 400;
        case ErrorKind::NOT_FOUND: return 404;
        case ErrorKind::DUPLICATE_OPEN_REQUEST: return 409;
        case ErrorKind::INVALID_TRANSITION: return 409;
        case ErrorKind::NONE: return 200;
        case ErrorKind::INTERNAL_ERROR: return 500;
    }
    return 500;
}

HttpResponse HttpServer::createErrorResponse(ErrorCode code, const std::string& message) const {
    int status_code = statusForError(code);

    std::ostringstream json;
    json << "{";
    json << "\"error\":\"" << ErrorHandler::errorKindToString(ErrorHandler::errorKind(code)) << "\",";
    json << "\"code\":\"" << ErrorHandler::errorCodeToString(code) << "\",";
    json << "\"message\":\"" << escapeJson(message) << "\",";
    json << "\"detail\":\"" << escapeJson(ErrorHandler::errorCodeToUserMessage(code)) << "\",";
    json << "\"status\":" << status_code;
    json << "}";
    return HttpResponse(status_code, json.str());
}

std::string HttpServer::statusText(int status_code) {
    switch (status_code) {
        case 200: return "OK";
        case 201: return "Created";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 500: return "Internal Server Error";
        default: return "Unknown";
    }
}

std::string HttpServer::createHttpResponse(const HttpResponse& response) {
    std::ostringstream out;
    out << "HTTP/1.1 " << response.status_code << " " << statusText(response.status_code) << "\r\n";
    out << "Content-Type: " << response.content_type << "\r\n";
    out << "Content-Length: " << response.body.length() << "\r\n";
    out << "Connection: close\r\n";
    out << CORS_HEADERS;
    out << "\r\n";
    out << response.body;
    return out.str();
}

std::string HttpServer::escapeJson(const std::string& str) {
    std::string result;
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream hex;
                    hex << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c));
                    result += hex.str();
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}
