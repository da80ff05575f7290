#pragma once
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <typeinfo>

#include "../Json/Json.hpp"
#include "../Log/Log.hpp"
#include "AExecutor_Strategy.hpp"

namespace tsched::exec {

// POST события задачи на внешний обработчик (overseer):
// {"action":"handle_event","event_type":"scheduled_task","event_data":{task_id, task_data, scheduled_time, execution_time}}
class ExecutorStrategyWebhook final : public AExecutorStrategy {
public:
    ExecutorStrategyWebhook(std::string host, std::uint16_t port, std::string target)
        : host_(std::move(host)), port_(port), target_(std::move(target)) {}

    // ожидает ctx["http_timeout_ms"] как int > 0
    void init(const Ctx& ctx) override {
        auto it = ctx.find("http_timeout_ms");
        if (it != ctx.end() && it->second.type() == typeid(int) && std::any_cast<int>(it->second) > 0) {
            timeout_ = std::chrono::milliseconds(std::any_cast<int>(it->second));
        }
    }

    std::chrono::milliseconds timeout() const { return timeout_; }

    // Весь обмен (connect + write + read) ограничен timeout_.
    // Дедлайн tcp_stream работает только для async_*, отсюда ioc.run() на локальном контексте.
    ExecResult execute(const ExecRequest& req) override {
        namespace asio  = boost::asio;
        namespace beast = boost::beast;
        namespace http  = beast::http;
        using tcp = asio::ip::tcp;

        asio::io_context ioc;
        beast::tcp_stream stream(ioc);
        beast::flat_buffer buffer;
        http::response<http::string_body> res;

        http::request<http::string_body> hreq{http::verb::post, target_, 11};
        hreq.set(http::field::host, host_);
        hreq.set(http::field::user_agent, "tsched-webhook");
        hreq.set(http::field::content_type, "application/json; charset=utf-8");
        hreq.body() = buildEvent(req).dump();
        hreq.prepare_payload();

        tcp::resolver::results_type endpoints;
        try {
            endpoints = tcp::resolver(ioc).resolve(host_, std::to_string(port_));
        } catch (const beast::system_error& e) {
            return ExecResult::failure("webhook " + host_ + ": resolve failed: " + e.code().message());
        }

        beast::error_code result;
        const char* stage = "connect";

        stream.expires_after(timeout_);
        stream.async_connect(endpoints, [&](beast::error_code ec, const tcp::endpoint&) {
            if (ec) { result = ec; return; }
            stage = "write";
            http::async_write(stream, hreq, [&](beast::error_code wec, std::size_t) {
                if (wec) { result = wec; return; }
                stage = "read";
                http::async_read(stream, buffer, res, [&](beast::error_code rec, std::size_t) {
                    result = rec;
                });
            });
        });
        ioc.run();

        beast::error_code ignored;
        stream.socket().shutdown(tcp::socket::shutdown_both, ignored);

        const std::string where = host_ + ":" + std::to_string(port_) + target_;
        if (result == beast::error::timeout)
            return ExecResult::failure("webhook " + where + " timed out during " + stage
                                       + " after " + std::to_string(timeout_.count()) + " ms");
        if (result)
            return ExecResult::failure("webhook " + where + " failed during " + stage + ": " + result.message());

        const unsigned code = res.result_int();
        if (code < 200 || code >= 300)
            return ExecResult::failure("webhook " + where + " returned HTTP " + std::to_string(code));
        return ExecResult::success(res.body());
    }

    std::string name() const override { return "WEBHOOK"; }

    static json::Value buildEvent(const ExecRequest& req) {
        json::Value data = json::Value::object();
        data["task_id"]        = req.taskId;
        data["task_data"]      = req.payload;
        data["scheduled_time"] = req.scheduledTime;
        data["execution_time"] = req.executionTime;

        json::Value ev = json::Value::object();
        ev["action"]     = "handle_event";
        ev["event_type"] = "scheduled_task";
        ev["event_data"] = std::move(data);
        return ev;
    }

private:
    std::string               host_;
    std::uint16_t             port_;
    std::string               target_;
    std::chrono::milliseconds timeout_{10000};
};

} // namespace tsched::exec
