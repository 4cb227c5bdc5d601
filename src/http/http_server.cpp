#include "weathermcp/http/http_server.hpp"
#include "weathermcp/utils/error.hpp"
#include "weathermcp/utils/json_utils.hpp"
#include "weathermcp/utils/logging.hpp"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <atomic>
#include <list>
#include <mutex>
#include <thread>

namespace weathermcp {
namespace http {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
using tcp = net::ip::tcp;

namespace {

constexpr const char *kAllowedHeaders =
    "Content-Type, Accept, mcp-session-id, mcp-protocol-version, "
    "Last-Event-ID";
constexpr const char *kAllowedMethods = "GET, POST, DELETE, OPTIONS";

transport::HttpMethod toMethod(bhttp::verb verb) {
  switch (verb) {
  case bhttp::verb::get:
    return transport::HttpMethod::Get;
  case bhttp::verb::post:
    return transport::HttpMethod::Post;
  case bhttp::verb::delete_:
    return transport::HttpMethod::Delete;
  default:
    return transport::HttpMethod::Other;
  }
}

void applyCors(bhttp::response<bhttp::string_body> &res) {
  res.set(bhttp::field::access_control_allow_origin, "*");
  res.set(bhttp::field::access_control_expose_headers,
          transport::kSessionIdHeader);
}

} // namespace

class HttpServer::Impl {
public:
  Impl(Options o, router::RequestRouter &r)
      : options(std::move(o)), router(r), acceptor(ioc), sweep_timer(ioc) {}

  struct Connection {
    std::shared_ptr<tcp::socket> socket;
    std::shared_ptr<std::atomic<bool>> done;
    std::thread worker;
  };

  Options options;
  router::RequestRouter &router;

  net::io_context ioc;
  tcp::acceptor acceptor;
  net::steady_timer sweep_timer;
  std::thread io_thread;
  std::atomic<bool> running{false};
  std::uint16_t bound_port = 0;

  std::mutex connections_mutex;
  std::list<Connection> connections;

  void bind() {
    boost::system::error_code ec;
    auto address = net::ip::make_address(options.host, ec);
    if (ec) {
      throw TransportException("Invalid listen address '" + options.host +
                               "': " + ec.message());
    }

    tcp::endpoint endpoint(address, options.port);
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) {
      acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    }
    if (!ec) {
      acceptor.bind(endpoint, ec);
    }
    if (!ec) {
      acceptor.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
      throw TransportException("Cannot listen on " + options.host + ":" +
                               std::to_string(options.port) + ": " +
                               ec.message());
    }
    bound_port = acceptor.local_endpoint().port();
  }

  void acceptNext() {
    acceptor.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
          if (ec) {
            if (running) {
              WEATHERMCP_LOG_WARNING("Accept failed: " << ec.message());
              acceptNext();
            }
            return;
          }
          spawn(std::move(socket));
          acceptNext();
        });
  }

  void scheduleSweep() {
    auto interval = std::max(
        std::chrono::seconds(1),
        std::min(options.session_idle_timeout, std::chrono::seconds(60)));
    sweep_timer.expires_after(interval);
    sweep_timer.async_wait([this](boost::system::error_code ec) {
      if (ec || !running) {
        return;
      }
      std::size_t closed =
          router.closeIdleSessions(options.session_idle_timeout);
      if (closed > 0) {
        WEATHERMCP_LOG_INFO("Closed " << closed << " idle session(s)");
      }
      scheduleSweep();
    });
  }

  void spawn(tcp::socket socket) {
    auto shared = std::make_shared<tcp::socket>(std::move(socket));
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(connections_mutex);
    reapFinished();
    connections.push_back(
        {.socket = shared,
         .done = done,
         .worker = std::thread([this, shared, done] {
           serve(*shared);
           *done = true;
         })});
  }

  // Caller holds connections_mutex
  void reapFinished() {
    for (auto it = connections.begin(); it != connections.end();) {
      if (*it->done) {
        it->worker.join();
        it = connections.erase(it);
      } else {
        ++it;
      }
    }
  }

  void serve(tcp::socket &socket) {
    beast::flat_buffer buffer;
    boost::system::error_code ec;

    for (;;) {
      bhttp::request<bhttp::string_body> req;
      bhttp::read(socket, buffer, req, ec);
      if (ec == bhttp::error::end_of_stream) {
        break;
      }
      if (ec) {
        if (running) {
          WEATHERMCP_LOG_DEBUG("Connection read ended: " << ec.message());
        }
        break;
      }

      auto res = makeResponse(req);
      bhttp::write(socket, res, ec);
      if (ec) {
        WEATHERMCP_LOG_DEBUG("Connection write failed: " << ec.message());
        break;
      }
      if (res.need_eof()) {
        break;
      }
    }

    socket.shutdown(tcp::socket::shutdown_send, ec);
  }

  bhttp::response<bhttp::string_body>
  makeResponse(const bhttp::request<bhttp::string_body> &req) {
    bhttp::response<bhttp::string_body> res{bhttp::status::ok, req.version()};
    res.keep_alive(req.keep_alive());
    applyCors(res);

    std::string target(req.target());
    std::string path = target.substr(0, target.find('?'));

    if (path != options.endpoint) {
      res.result(bhttp::status::not_found);
      res.set(bhttp::field::content_type, "application/json");
      res.body() = R"({"error":"Not found"})";
      res.prepare_payload();
      return res;
    }

    if (req.method() == bhttp::verb::options) {
      res.result(bhttp::status::no_content);
      res.set(bhttp::field::access_control_allow_methods, kAllowedMethods);
      res.set(bhttp::field::access_control_allow_headers, kAllowedHeaders);
      res.set(bhttp::field::access_control_max_age, "86400");
      res.prepare_payload();
      return res;
    }

    transport::RequestEnvelope envelope;
    envelope.method = toMethod(req.method());
    if (auto it = req.find(transport::kSessionIdHeader); it != req.end()) {
      envelope.session_id = std::string(it->value());
    }
    envelope.accept = std::string(req[bhttp::field::accept]);
    if (!req.body().empty()) {
      try {
        envelope.body = json_utils::parse(req.body());
      } catch (const ProtocolException &e) {
        WEATHERMCP_LOG_DEBUG("Unparseable request body: " << e.what());
      }
    }

    WEATHERMCP_LOG_DEBUG(req.method_string() << " " << target << " from "
                                             << "session "
                                             << envelope.session_id.value_or(
                                                    "<none>"));

    transport::HttpReply reply;
    try {
      reply = router.handle(envelope);
    } catch (const std::exception &e) {
      WEATHERMCP_LOG_ERROR("Unhandled error serving request: " << e.what());
      reply = transport::errorReply(
          createErrorResponse(envelope.correlationId(),
                              types::ErrorCode::ServerError,
                              "Internal Server Error"));
    }

    res.result(static_cast<unsigned>(reply.status));
    if (!reply.content_type.empty()) {
      res.set(bhttp::field::content_type, reply.content_type);
    }
    for (const auto &[name, value] : reply.headers) {
      res.set(name, value);
    }
    res.body() = std::move(reply.body);
    res.prepare_payload();
    return res;
  }
};

HttpServer::HttpServer(Options options, router::RequestRouter &router)
    : impl_(std::make_unique<Impl>(std::move(options), router)) {}

HttpServer::~HttpServer() { stop(); }

void HttpServer::start() {
  if (impl_->running.exchange(true)) {
    return;
  }

  try {
    impl_->bind();
  } catch (...) {
    impl_->running = false;
    throw;
  }

  impl_->acceptNext();
  if (impl_->options.session_idle_timeout.count() > 0) {
    impl_->scheduleSweep();
  }
  impl_->io_thread = std::thread([this] { impl_->ioc.run(); });

  WEATHERMCP_LOG_INFO("MCP Weather Server (Streamable HTTP) listening on http://"
                      << impl_->options.host << ":" << impl_->bound_port
                      << impl_->options.endpoint);
}

void HttpServer::stop() {
  if (!impl_->running.exchange(false)) {
    return;
  }

  net::post(impl_->ioc, [this] {
    boost::system::error_code ec;
    impl_->acceptor.close(ec);
    impl_->sweep_timer.cancel();
  });
  if (impl_->io_thread.joinable()) {
    impl_->io_thread.join();
  }

  auto sessions = impl_->router.registry().snapshot();
  for (auto &session : sessions) {
    session->close();
  }

  std::list<Impl::Connection> connections;
  {
    std::lock_guard<std::mutex> lock(impl_->connections_mutex);
    connections.swap(impl_->connections);
  }
  for (auto &connection : connections) {
    boost::system::error_code ec;
    connection.socket->shutdown(tcp::socket::shutdown_both, ec);
  }
  for (auto &connection : connections) {
    if (connection.worker.joinable()) {
      connection.worker.join();
    }
  }

  WEATHERMCP_LOG_INFO("HTTP listener stopped, closed " << sessions.size()
                                                       << " session(s)");
}

bool HttpServer::isRunning() const { return impl_->running; }

std::uint16_t HttpServer::port() const { return impl_->bound_port; }

} // namespace http
} // namespace weathermcp
