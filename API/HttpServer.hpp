#pragma once
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "../Json/Json.hpp"
#include "../Log/Log.hpp"
#include "../Scheduler/Commands.hpp"
#include "../Scheduler/Scheduler.hpp"

namespace asio  = boost::asio;
namespace beast = boost::beast;
namespace http  = beast::http;
using tcp = asio::ip::tcp;

// -------------------------- RESPONSE HELPERS --------------------------

static inline http::response<http::string_body>
make_json(http::request<http::string_body> const& req, http::status st, const std::string& body) {
    http::response<http::string_body> res{st, req.version()};
    res.set(http::field::content_type, "application/json; charset=utf-8");
    res.set(http::field::server, "tsched-http");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

static inline http::response<http::string_body>
make_text(http::request<http::string_body> const& req, http::status st, const std::string& body) {
    http::response<http::string_body> res{st, req.version()};
    res.set(http::field::content_type, "text/plain; charset=utf-8");
    res.set(http::field::server, "tsched-http");
    res.keep_alive(req.keep_alive());
    res.body() = body;
    res.prepare_payload();
    return res;
}

// error -> код: validation 400, not_found 404, internal 500
static inline http::status status_for(const tsched::json::Value& result) {
    if (result.getString("status") != "error") return http::status::ok;
    const std::string err = result.getString("error");
    if (err == "validation") return http::status::bad_request;
    if (err == "not_found")  return http::status::not_found;
    return http::status::internal_server_error;
}

static inline http::response<http::string_body>
make_result(http::request<http::string_body> const& req, const tsched::json::Value& result) {
    return make_json(req, status_for(result), result.dump());
}

// "%41b+c" -> "Ab+c"; false на битой последовательности
static inline bool url_decode(const std::string& in, std::string& out) {
    out.clear();
    out.reserve(in.size());
    auto hex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] != '%') { out += in[i]; continue; }
        if (i + 2 >= in.size()) return false;
        const int hi = hex(in[i + 1]);
        const int lo = hex(in[i + 2]);
        if (hi < 0 || lo < 0) return false;
        out += (char)(hi * 16 + lo);
        i += 2;
    }
    return true;
}

// -------------------------- ROUTER --------------------------

static inline http::response<http::string_body>
route_request(tsched::Scheduler& sched, http::request<http::string_body>& req) {
    using namespace tsched;
    std::string target = std::string(req.target());
    if (auto q = target.find('?'); q != std::string::npos) target.erase(q);
    const auto method = req.method();

    // health
    if (method == http::verb::get && target == "/status") {
        json::Value v = json::Value::object();
        v["status"]  = "ok";
        v["running"] = sched.isRunning();
        return make_json(req, http::status::ok, v.dump());
    }

    if (method == http::verb::get && target == "/tasks")
        return make_result(req, cmd::run(sched, cmd::GetPendingTasks{}));

    if (method == http::verb::get && target == "/stats")
        return make_result(req, cmd::run(sched, cmd::GetStats{}));

    if (method == http::verb::post && target == "/scheduler/start")
        return make_result(req, cmd::run(sched, cmd::StartScheduler{}));

    if (method == http::verb::post && target == "/scheduler/stop")
        return make_result(req, cmd::run(sched, cmd::StopScheduler{}));

    // DELETE /tasks/<id>
    if (method == http::verb::delete_ && target.rfind("/tasks/", 0) == 0) {
        std::string id;
        if (!url_decode(target.substr(std::string("/tasks/").size()), id))
            return make_text(req, http::status::bad_request, "bad percent-encoding in task id");
        if (id.empty()) return make_text(req, http::status::bad_request, "task id required");
        return make_result(req, cmd::run(sched, cmd::CancelTask{id}));
    }

    // POST /tasks, POST /commands: тело JSON
    if (method == http::verb::post && (target == "/tasks" || target == "/commands")) {
        json::Value body;
        try {
            body = json::Value::parse(req.body());
        } catch (const json::ParseError& e) {
            return make_result(req, cmd::toJson(OpResult::fail(ErrorKind::VALIDATION,
                                                               std::string("malformed JSON: ") + e.what())));
        }

        if (target == "/commands") return make_result(req, cmd::handle(sched, body));

        try {
            return make_result(req, cmd::run(sched, cmd::ScheduleTask{cmd::parseScheduleRequest(body)}));
        } catch (const ValidationError& e) {
            return make_result(req, cmd::toJson(OpResult::fail(ErrorKind::VALIDATION, e.what())));
        }
    }

    return make_text(req, http::status::not_found, "Not found");
}

// Не бросает: исключение из маршрута -> 500
static inline http::response<http::string_body>
handle_request(tsched::Scheduler& sched, http::request<http::string_body>&& req) {
    try {
        return route_request(sched, req);
    } catch (const std::exception& e) {
        tsched::log::error("Http", std::string(req.method_string()) + " " + std::string(req.target()) + " failed: " + e.what());
        return make_result(req, tsched::cmd::toJson(tsched::OpResult::fail(tsched::ErrorKind::INTERNAL, e.what())));
    }
}

// -------------------------- SESSION + LISTENER --------------------------

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, tsched::Scheduler& sched)
        : socket_(std::move(socket)), sched_(sched) {}
    void run() { do_read(); }

private:
    tcp::socket socket_;
    tsched::Scheduler& sched_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    std::shared_ptr<void> hold_;

    void do_read() {
        req_ = {};
        http::async_read(socket_, buffer_, req_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_read(ec);
            });
    }

    void on_read(beast::error_code ec) {
        if (ec == http::error::end_of_stream) return do_close();
        if (ec) {
            tsched::log::debug("Http", "read failed: " + ec.message());
            return;
        }

        const bool keepAlive = req_.keep_alive();
        auto res = std::make_shared<http::response<http::string_body>>(
            handle_request(sched_, std::move(req_))
        );
        res->keep_alive(keepAlive);
        hold_ = res;

        http::async_write(socket_, *res,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->on_write(ec);
            });
    }

    void on_write(beast::error_code ec) {
        auto res = std::static_pointer_cast<http::response<http::string_body>>(hold_);
        const bool keepAlive = res && res->keep_alive();
        hold_.reset();
        if (ec) {
            tsched::log::debug("Http", "write failed: " + ec.message());
            return;
        }
        if (!keepAlive) return do_close();
        do_read();
    }

    void do_close() {
        beast::error_code ec;
        socket_.shutdown(tcp::socket::shutdown_send, ec);
    }
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, tcp::endpoint ep, tsched::Scheduler& sched)
        : ioc_(ioc), acceptor_(ioc), sched_(sched) {
        beast::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec) acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(ep, ec);
        if (!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("HTTP listen on " + ep.address().to_string() + ":"
                                     + std::to_string(ep.port()) + " failed: " + ec.message());
    }

    void run() { do_accept(); }

    tcp::endpoint local_endpoint() const { return acceptor_.local_endpoint(); }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;
    tsched::Scheduler& sched_;

    void do_accept() {
        acceptor_.async_accept(
            asio::make_strand(ioc_),
            [self = shared_from_this()](beast::error_code ec, tcp::socket s) {
                if (ec == asio::error::operation_aborted) return;
                if (!ec) std::make_shared<HttpSession>(std::move(s), self->sched_)->run();
                else tsched::log::warn("Http", "accept failed: " + ec.message());
                self->do_accept();
            });
    }
};

// threads > 1: долгий запрос (например, /scheduler/stop) не блокирует остальных клиентов
class TS_HttpServer {
public:
    TS_HttpServer(std::string address, uint16_t port, tsched::Scheduler& sched, int threads = 2)
        : ioc_(threads), address_(std::move(address)), port_(port), sched_(sched),
          threads_(threads < 1 ? 1 : threads) {}

    // бросает runtime_error, если порт занят или адрес невалиден
    void start() {
        beast::error_code ec;
        auto addr = asio::ip::make_address(address_, ec);
        if (ec) throw std::runtime_error("Invalid HTTP address: " + address_);
        listener_ = std::make_shared<Listener>(ioc_, tcp::endpoint(addr, port_), sched_);
        listener_->run();
        tsched::log::info("Http", "listening on http://" + address_ + ":" + std::to_string(port()));
    }

    // blocking: threads_ - 1 дополнительных потоков + вызывающий
    void run() {
        std::vector<std::thread> extra;
        extra.reserve(threads_ - 1);
        for (int i = 1; i < threads_; ++i) extra.emplace_back([this] { ioc_.run(); });
        ioc_.run();
        for (auto& t : extra) t.join();
    }

    void stop() { ioc_.stop(); }

    // фактический порт (для port = 0)
    uint16_t port() const { return listener_ ? listener_->local_endpoint().port() : port_; }

private:
    asio::io_context ioc_;
    std::string address_;
    uint16_t port_{8080};
    tsched::Scheduler& sched_;
    int threads_{2};
    std::shared_ptr<Listener> listener_;
};
