#include "transport/gateway_server.hpp"

#include "core/time_utils.hpp"
#include "core/uuid.hpp"
#include "rpc/jsonrpc_message.hpp"
#include "transport/origin_policy.hpp"
#include "transport/tls_context.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>
#include <vector>

namespace hwbridge::transport {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr std::chrono::seconds kHandshakeTimeout{30};
constexpr std::chrono::seconds kShutdownGrace{2};
// Inbound frames above this size are a protocol violation.
constexpr std::size_t kMaxFrameBytes = 16U * 1024U * 1024U;

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

} // namespace

// Transport-neutral view of one socket, used by the connection table.
class GatewayConnection {
public:
  virtual ~GatewayConnection() = default;
  virtual const std::string& Id() const = 0;
  virtual void Send(std::shared_ptr<const std::string> frame) = 0;
  virtual void Close(websocket::close_code code, std::string reason) = 0;
};

struct GatewayServer::Impl {
  Impl(config::GatewayConfig gateway_config, const rpc::Dispatcher& rpc_dispatcher,
       services::GatewayServices& gateway_services, core::logging::Logger gateway_logger)
      : config(std::move(gateway_config)),
        dispatcher(rpc_dispatcher),
        services(gateway_services),
        logger(std::move(gateway_logger)),
        io(static_cast<int>(std::max<std::uint32_t>(1, config.io_threads))),
        acceptor(asio::make_strand(io)),
        handler_pool(std::max<std::uint32_t>(1, config.handler_threads)),
        tls(ssl::context::tls_server) {}

  void DoAccept();
  void OnAccept(beast::error_code ec, tcp::socket socket);

  // Admission control. Returns the close code for rejected sockets.
  std::optional<websocket::close_code> Admit(const std::string& origin,
                                             const std::shared_ptr<GatewayConnection>& connection,
                                             std::string& reason);
  void Unregister(const std::string& connection_id);
  std::vector<std::shared_ptr<GatewayConnection>> Snapshot() const;

  config::GatewayConfig config;
  const rpc::Dispatcher& dispatcher;
  services::GatewayServices& services;
  core::logging::Logger logger;

  asio::io_context io;
  tcp::acceptor acceptor;
  asio::thread_pool handler_pool;
  ssl::context tls;
  std::vector<std::thread> io_threads;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;

  mutable std::mutex mutex;
  std::condition_variable drained;
  std::map<std::string, std::weak_ptr<GatewayConnection>> connections;
  bool accepting = false;
  bool stopped = false;
};

namespace {

template <class Stream>
class WebSocketSession final : public GatewayConnection,
                               public std::enable_shared_from_this<WebSocketSession<Stream>> {
public:
  static constexpr bool kIsTls = std::is_same_v<Stream, TlsStream>;

  template <class... Args>
  WebSocketSession(GatewayServer::Impl& server, Args&&... args)
      : server_(server),
        ws_(std::forward<Args>(args)...),
        idle_timer_(ws_.get_executor()),
        id_(core::GenerateUuid()) {
    beast::error_code ec;
    const auto endpoint = beast::get_lowest_layer(ws_).socket().remote_endpoint(ec);
    if (!ec) {
      remote_ = endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }
  }

  const std::string& Id() const override {
    return id_;
  }

  void Run() {
    beast::get_lowest_layer(ws_).expires_after(kHandshakeTimeout);
    if constexpr (kIsTls) {
      ws_.next_layer().async_handshake(
          ssl::stream_base::server,
          beast::bind_front_handler(&WebSocketSession::OnTlsHandshake, this->shared_from_this()));
    } else {
      ReadUpgrade();
    }
  }

  void Send(std::shared_ptr<const std::string> frame) override {
    asio::post(ws_.get_executor(), [self = this->shared_from_this(), frame = std::move(frame)]() {
      if (self->closing_ || !self->open_) {
        return;
      }
      self->outbox_.push_back(frame);
      if (self->outbox_.size() == 1) {
        self->DoWrite();
      }
    });
  }

  void Close(websocket::close_code code, std::string reason) override {
    asio::post(ws_.get_executor(),
               [self = this->shared_from_this(), code, reason = std::move(reason)]() {
                 self->DoClose(code, reason);
               });
  }

private:
  void OnTlsHandshake(beast::error_code ec) {
    if (ec) {
      server_.logger.Warn("tls handshake failed",
                          {{"remote", remote_}, {"error", ec.message()}});
      return;
    }
    ReadUpgrade();
  }

  void ReadUpgrade() {
    http::async_read(
        ws_.next_layer(), buffer_, upgrade_,
        beast::bind_front_handler(&WebSocketSession::OnUpgradeRead, this->shared_from_this()));
  }

  void OnUpgradeRead(beast::error_code ec, std::size_t) {
    if (ec) {
      server_.logger.Debug("upgrade read failed", {{"remote", remote_}, {"error", ec.message()}});
      return;
    }
    if (!websocket::is_upgrade(upgrade_)) {
      server_.logger.Warn("non-websocket request rejected", {{"remote", remote_}});
      beast::error_code ignored;
      beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ignored);
      return;
    }

    beast::get_lowest_layer(ws_).expires_never();
    websocket::stream_base::timeout timeouts =
        websocket::stream_base::timeout::suggested(beast::role_type::server);
    // Beast pings once half the idle window has passed in silence.
    timeouts.idle_timeout = server_.config.keep_alive_interval * 2;
    timeouts.keep_alive_pings = true;
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator([](websocket::response_type& response) {
      response.set(http::field::server, std::string("hwbridge/") + services::kServerVersion);
    }));
    ws_.read_message_max(kMaxFrameBytes);

    const std::string origin(upgrade_[http::field::origin]);
    ws_.async_accept(upgrade_, beast::bind_front_handler(&WebSocketSession::OnAccept,
                                                         this->shared_from_this(), origin));
  }

  void OnAccept(const std::string& origin, beast::error_code ec) {
    if (ec) {
      server_.logger.Warn("websocket accept failed",
                          {{"remote", remote_}, {"error", ec.message()}});
      return;
    }

    std::string reason;
    const auto rejection = server_.Admit(origin, this->shared_from_this(), reason);
    if (rejection.has_value()) {
      server_.logger.Warn("connection rejected", {{"remote", remote_},
                                                  {"origin", origin},
                                                  {"reason", reason}});
      open_ = true;
      DoClose(*rejection, reason);
      return;
    }

    open_ = true;
    registered_ = true;
    server_.logger.Info("connection accepted",
                        {{"connection_id", id_}, {"remote", remote_}, {"origin", origin}});

    core::json::Value params = core::json::MakeObject();
    params.Set("connectionId", core::json::MakeString(id_));
    params.Set("serverVersion", core::json::MakeString(services::kServerVersion));
    params.Set("timestamp", core::json::MakeString(core::NowUtcTimestamp()));
    outbox_.push_back(std::make_shared<const std::string>(
        rpc::BuildNotification("server.connected", std::move(params))));
    DoWrite();

    ArmIdleTimer();
    DoRead();
  }

  void ArmIdleTimer() {
    if (server_.config.connection_timeout.count() <= 0) {
      return;
    }
    idle_timer_.expires_after(server_.config.connection_timeout);
    idle_timer_.async_wait([weak = this->weak_from_this()](const beast::error_code& ec) {
      if (ec == asio::error::operation_aborted) {
        return;
      }
      if (auto self = weak.lock()) {
        self->server_.logger.Info("connection idle timeout", {{"connection_id", self->id_}});
        self->DoClose(websocket::close_code::going_away, "Idle timeout");
      }
    });
  }

  void DoRead() {
    ws_.async_read(read_buffer_, beast::bind_front_handler(&WebSocketSession::OnRead,
                                                           this->shared_from_this()));
  }

  void OnRead(beast::error_code ec, std::size_t) {
    if (ec) {
      Finish(ec);
      return;
    }
    ArmIdleTimer();

    if (!ws_.got_text()) {
      read_buffer_.consume(read_buffer_.size());
      server_.logger.Debug("binary frame ignored", {{"connection_id", id_}});
      DoRead();
      return;
    }

    std::string frame = beast::buffers_to_string(read_buffer_.data());
    read_buffer_.consume(read_buffer_.size());

    // Handlers may block on devices; run them off the I/O threads and let
    // responses come back in completion order.
    asio::post(server_.handler_pool,
               [self = this->shared_from_this(), frame = std::move(frame)]() {
                 const rpc::RequestContext context{.connection_id = self->id_};
                 std::optional<std::string> response =
                     self->server_.dispatcher.HandleFrame(context, frame);
                 if (response.has_value()) {
                   self->Send(std::make_shared<const std::string>(std::move(*response)));
                 }
               });
    DoRead();
  }

  void DoWrite() {
    if (outbox_.empty() || closing_) {
      return;
    }
    ws_.text(true);
    ws_.async_write(asio::buffer(*outbox_.front()),
                    beast::bind_front_handler(&WebSocketSession::OnWrite,
                                              this->shared_from_this()));
  }

  void OnWrite(beast::error_code ec, std::size_t) {
    if (ec) {
      server_.logger.Debug("write failed", {{"connection_id", id_}, {"error", ec.message()}});
      outbox_.clear();
      return;
    }
    outbox_.pop_front();
    DoWrite();
  }

  void DoClose(websocket::close_code code, const std::string& reason) {
    if (closing_ || !open_) {
      return;
    }
    closing_ = true;
    idle_timer_.cancel();
    ws_.async_close(websocket::close_reason(code, reason),
                    [self = this->shared_from_this()](beast::error_code ec) {
                      self->Finish(ec);
                    });
  }

  void Finish(beast::error_code ec) {
    if (finished_) {
      return;
    }
    finished_ = true;
    idle_timer_.cancel();
    outbox_.clear();
    if (!registered_) {
      return;
    }
    const bool normal = !ec || ec == websocket::error::closed;
    server_.logger.Info("connection closed", {{"connection_id", id_},
                                              {"remote", remote_},
                                              {"reason", normal ? "closed" : ec.message()}});
    server_.Unregister(id_);
  }

  GatewayServer::Impl& server_;
  Stream ws_;
  asio::steady_timer idle_timer_;
  beast::flat_buffer buffer_;
  beast::flat_buffer read_buffer_;
  http::request<http::string_body> upgrade_;
  std::deque<std::shared_ptr<const std::string>> outbox_;
  std::string id_;
  std::string remote_ = "unknown";
  bool open_ = false;
  bool registered_ = false;
  bool closing_ = false;
  bool finished_ = false;
};

} // namespace

void GatewayServer::Impl::DoAccept() {
  acceptor.async_accept(asio::make_strand(io), [this](beast::error_code ec, tcp::socket socket) {
    OnAccept(ec, std::move(socket));
  });
}

void GatewayServer::Impl::OnAccept(beast::error_code ec, tcp::socket socket) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!accepting) {
      return;
    }
  }
  if (ec) {
    if (ec != asio::error::operation_aborted) {
      logger.Warn("accept failed", {{"error", ec.message()}});
      DoAccept();
    }
    return;
  }

  if (config.use_tls) {
    std::make_shared<WebSocketSession<TlsStream>>(*this, std::move(socket), tls)->Run();
  } else {
    std::make_shared<WebSocketSession<PlainStream>>(*this, std::move(socket))->Run();
  }
  DoAccept();
}

std::optional<websocket::close_code> GatewayServer::Impl::Admit(
    const std::string& origin, const std::shared_ptr<GatewayConnection>& connection,
    std::string& reason) {
  if (!IsOriginAllowed(config.allowed_origins, origin)) {
    reason = "Unauthorized origin";
    return websocket::close_code::policy_error;
  }
  std::lock_guard<std::mutex> lock(mutex);
  if (stopped) {
    reason = "Server shutting down";
    return websocket::close_code::going_away;
  }
  if (connections.size() >= config.max_connections) {
    reason = "Server overloaded";
    return websocket::close_code::try_again_later;
  }
  connections.emplace(connection->Id(), connection);
  return std::nullopt;
}

void GatewayServer::Impl::Unregister(const std::string& connection_id) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    connections.erase(connection_id);
  }
  drained.notify_all();
  services.OnConnectionClosed(connection_id);
}

std::vector<std::shared_ptr<GatewayConnection>> GatewayServer::Impl::Snapshot() const {
  std::vector<std::shared_ptr<GatewayConnection>> live;
  std::lock_guard<std::mutex> lock(mutex);
  live.reserve(connections.size());
  for (const auto& [id, weak] : connections) {
    if (auto connection = weak.lock()) {
      live.push_back(std::move(connection));
    }
  }
  return live;
}

GatewayServer::GatewayServer(config::GatewayConfig config, const rpc::Dispatcher& dispatcher,
                             services::GatewayServices& services, core::logging::Logger logger)
    : impl_(std::make_shared<Impl>(std::move(config), dispatcher, services, std::move(logger))) {}

GatewayServer::~GatewayServer() {
  Stop();
}

bool GatewayServer::Start(std::string& error) {
  Impl& impl = *impl_;
  if (impl.config.use_tls && !ConfigureServerTls(impl.config, impl.tls, error)) {
    return false;
  }

  beast::error_code ec;
  const auto address = asio::ip::make_address(
      impl.config.host == "localhost" ? std::string("127.0.0.1") : impl.config.host, ec);
  if (ec) {
    error = "invalid listen host '" + impl.config.host + "': " + ec.message();
    return false;
  }
  const tcp::endpoint endpoint(address, impl.config.port);
  impl.acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    impl.acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    impl.acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    impl.acceptor.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    error = "failed to listen on " + impl.config.host + ":" + std::to_string(impl.config.port) +
            ": " + ec.message();
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.accepting = true;
  }
  impl.services.SetNotificationSink(this);
  impl.work.emplace(asio::make_work_guard(impl.io));
  impl.DoAccept();
  const std::uint32_t threads = std::max<std::uint32_t>(1, impl.config.io_threads);
  for (std::uint32_t i = 0; i < threads; ++i) {
    impl.io_threads.emplace_back([&impl]() { impl.io.run(); });
  }

  impl.logger.Info("gateway listening", {{"host", impl.config.host},
                                         {"port", std::to_string(BoundPort())},
                                         {"tls", impl.config.use_tls ? "true" : "false"},
                                         {"mutual_tls",
                                          impl.config.enable_mutual_tls ? "true" : "false"},
                                         {"max_connections",
                                          std::to_string(impl.config.max_connections)}});
  return true;
}

void GatewayServer::Stop() {
  Impl& impl = *impl_;
  {
    std::lock_guard<std::mutex> lock(impl.mutex);
    if (impl.stopped) {
      return;
    }
    impl.stopped = true;
    impl.accepting = false;
  }
  impl.services.SetNotificationSink(nullptr);

  if (impl.io_threads.empty()) {
    impl.handler_pool.join();
    return;
  }

  asio::post(impl.acceptor.get_executor(), [&impl]() {
    beast::error_code ignored;
    impl.acceptor.close(ignored);
  });
  for (const auto& connection : impl.Snapshot()) {
    connection->Close(websocket::close_code::going_away, "Server shutting down");
  }
  {
    std::unique_lock<std::mutex> lock(impl.mutex);
    impl.drained.wait_for(lock, kShutdownGrace, [&impl]() { return impl.connections.empty(); });
  }

  impl.handler_pool.join();
  impl.work.reset();
  impl.io.stop();
  for (auto& thread : impl.io_threads) {
    thread.join();
  }
  impl.io_threads.clear();
  impl.logger.Info("gateway stopped");
}

std::uint16_t GatewayServer::BoundPort() const {
  beast::error_code ec;
  const auto endpoint = impl_->acceptor.local_endpoint(ec);
  return ec ? impl_->config.port : endpoint.port();
}

void GatewayServer::Broadcast(const std::string& frame) {
  const auto shared = std::make_shared<const std::string>(frame);
  for (const auto& connection : impl_->Snapshot()) {
    connection->Send(shared);
  }
}

bool GatewayServer::SendTo(const std::string& connection_id, const std::string& frame) {
  std::shared_ptr<GatewayConnection> connection;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    const auto it = impl_->connections.find(connection_id);
    if (it == impl_->connections.end()) {
      return false;
    }
    connection = it->second.lock();
  }
  if (connection == nullptr) {
    return false;
  }
  connection->Send(std::make_shared<const std::string>(frame));
  return true;
}

std::size_t GatewayServer::ConnectionCount() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->connections.size();
}

} // namespace hwbridge::transport
