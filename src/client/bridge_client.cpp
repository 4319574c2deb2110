#include "client/bridge_client.hpp"

#include "core/json_fields.hpp"
#include "rpc/jsonrpc_message.hpp"
#include "transport/tls_context.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

namespace hwbridge::client {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;

namespace {

constexpr std::size_t kMaxQueuedNotifications = 1024;

using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

struct PendingCall {
  bool done = false;
  bool ok = false;
  core::json::Value result;
  core::errors::RpcError error;
};

// Transport-neutral handle on the socket, implemented per stream type.
class ClientStream {
public:
  virtual ~ClientStream() = default;
  virtual void Open(const GatewayUrl& url, const ClientOptions& options,
                    std::function<void(const std::string& error)> done) = 0;
  virtual void Send(std::shared_ptr<const std::string> frame) = 0;
  virtual void Close() = 0;
};

} // namespace

bool ParseGatewayUrl(std::string_view url, GatewayUrl& parsed, std::string& error) {
  parsed = {};
  if (url.rfind("wss://", 0) == 0) {
    parsed.tls = true;
    url.remove_prefix(6);
  } else if (url.rfind("ws://", 0) == 0) {
    url.remove_prefix(5);
  } else {
    error = "gateway URL must start with ws:// or wss://";
    return false;
  }

  const std::size_t slash = url.find('/');
  std::string_view authority = url.substr(0, slash);
  if (slash != std::string_view::npos) {
    parsed.target = std::string(url.substr(slash));
  }
  const std::size_t colon = authority.rfind(':');
  if (colon != std::string_view::npos) {
    parsed.host = std::string(authority.substr(0, colon));
    parsed.port = std::string(authority.substr(colon + 1));
  } else {
    parsed.host = std::string(authority);
    parsed.port = parsed.tls ? "443" : "80";
  }
  if (parsed.host.empty()) {
    error = "gateway URL is missing a host";
    return false;
  }
  if (parsed.port.empty() ||
      parsed.port.find_first_not_of("0123456789") != std::string::npos) {
    error = "gateway URL has an invalid port '" + parsed.port + "'";
    return false;
  }
  return true;
}

struct BridgeClient::Impl {
  explicit Impl(core::logging::Logger client_logger)
      : logger(std::move(client_logger)), tls(ssl::context::tls_client) {}

  void OnFrame(const std::string& text);
  void OnDisconnected(std::optional<std::uint16_t> code);
  bool SendFrame(std::string frame, std::string& error);

  core::logging::Logger logger;
  asio::io_context io;
  ssl::context tls;
  std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work;
  std::thread thread;
  std::unique_ptr<ClientStream> stream;
  std::chrono::milliseconds request_timeout{30000};
  std::atomic<std::int64_t> next_id{0};

  mutable std::mutex mutex;
  std::condition_variable changed;
  bool open = false;
  bool closed = false;
  std::optional<std::uint16_t> close_code;
  std::string connection_id;
  std::map<std::int64_t, std::shared_ptr<PendingCall>> pending;
  std::deque<std::pair<std::string, core::json::Value>> notifications;
  NotificationHandler handler;
};

namespace {

template <class Stream>
class ClientStreamImpl final : public ClientStream {
public:
  static constexpr bool kIsTls = std::is_same_v<Stream, TlsStream>;

  template <class Executor, class... Rest>
  ClientStreamImpl(BridgeClient::Impl& client, Executor executor, Rest&... rest)
      : client_(client), resolver_(executor), ws_(executor, rest...) {}

  void Open(const GatewayUrl& url, const ClientOptions& options,
            std::function<void(const std::string& error)> done) override {
    url_ = url;
    options_ = options;
    done_ = std::move(done);
    resolver_.async_resolve(url_.host, url_.port,
                            [this](beast::error_code ec, tcp::resolver::results_type results) {
                              OnResolve(ec, std::move(results));
                            });
  }

  void Send(std::shared_ptr<const std::string> frame) override {
    asio::post(ws_.get_executor(), [this, frame = std::move(frame)]() {
      if (closing_) {
        return;
      }
      outbox_.push_back(frame);
      if (outbox_.size() == 1) {
        DoWrite();
      }
    });
  }

  void Close() override {
    asio::post(ws_.get_executor(), [this]() {
      if (closing_ || !handshaken_) {
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        return;
      }
      closing_ = true;
      ws_.async_close(websocket::close_code::normal, [this](beast::error_code) {
        client_.OnDisconnected(static_cast<std::uint16_t>(websocket::close_code::normal));
      });
    });
  }

private:
  void Fail(const std::string& stage, beast::error_code ec) {
    if (done_) {
      auto done = std::move(done_);
      done_ = nullptr;
      done(stage + ": " + ec.message());
    }
  }

  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) {
      Fail("resolve " + url_.host, ec);
      return;
    }
    beast::get_lowest_layer(ws_).expires_after(options_.connect_timeout);
    beast::get_lowest_layer(ws_).async_connect(
        results, [this](beast::error_code connect_ec, const tcp::endpoint&) {
          OnConnect(connect_ec);
        });
  }

  void OnConnect(beast::error_code ec) {
    if (ec) {
      Fail("connect " + url_.host + ":" + url_.port, ec);
      return;
    }
    if constexpr (kIsTls) {
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), url_.host.c_str())) {
        Fail("tls", beast::error_code(static_cast<int>(::ERR_get_error()),
                                      asio::error::get_ssl_category()));
        return;
      }
      ws_.next_layer().async_handshake(ssl::stream_base::client,
                                       [this](beast::error_code tls_ec) {
                                         if (tls_ec) {
                                           Fail("tls handshake", tls_ec);
                                           return;
                                         }
                                         Upgrade();
                                       });
    } else {
      Upgrade();
    }
  }

  void Upgrade() {
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    const std::string origin = options_.origin;
    ws_.set_option(
        websocket::stream_base::decorator([origin](websocket::request_type& request) {
          request.set(beast::http::field::user_agent, "hwbridge-client");
          if (!origin.empty()) {
            request.set(beast::http::field::origin, origin);
          }
        }));
    ws_.async_handshake(url_.host + ":" + url_.port, url_.target, [this](beast::error_code ec) {
      if (ec) {
        Fail("websocket handshake", ec);
        return;
      }
      handshaken_ = true;
      if (done_) {
        auto done = std::move(done_);
        done_ = nullptr;
        done("");
      }
      DoRead();
    });
  }

  void DoRead() {
    ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) {
      if (ec) {
        std::optional<std::uint16_t> code;
        if (ec == websocket::error::closed) {
          code = static_cast<std::uint16_t>(ws_.reason().code);
        }
        closing_ = true;
        client_.OnDisconnected(code);
        return;
      }
      const std::string text = beast::buffers_to_string(buffer_.data());
      buffer_.consume(buffer_.size());
      client_.OnFrame(text);
      DoRead();
    });
  }

  void DoWrite() {
    if (outbox_.empty()) {
      return;
    }
    ws_.text(true);
    ws_.async_write(asio::buffer(*outbox_.front()), [this](beast::error_code ec, std::size_t) {
      if (ec) {
        outbox_.clear();
        return;
      }
      outbox_.pop_front();
      DoWrite();
    });
  }

  BridgeClient::Impl& client_;
  tcp::resolver resolver_;
  Stream ws_;
  GatewayUrl url_;
  ClientOptions options_;
  std::function<void(const std::string&)> done_;
  beast::flat_buffer buffer_;
  std::deque<std::shared_ptr<const std::string>> outbox_;
  bool handshaken_ = false;
  bool closing_ = false;
};

} // namespace

void BridgeClient::Impl::OnFrame(const std::string& text) {
  core::json::Value message;
  std::string parse_error;
  if (!core::json::Parser(text).Parse(message, parse_error) || !message.IsObject()) {
    logger.Warn("unparseable frame from gateway", {{"error", parse_error}});
    return;
  }

  const core::json::Value* id = message.Find("id");
  std::int64_t numeric_id = 0;
  if (id != nullptr && core::json::TryGetInteger(*id, numeric_id)) {
    std::shared_ptr<PendingCall> call;
    {
      std::lock_guard<std::mutex> lock(mutex);
      const auto it = pending.find(numeric_id);
      if (it == pending.end()) {
        return;
      }
      call = it->second;
      pending.erase(it);
      if (const core::json::Value* error = message.Find("error"); error != nullptr) {
        std::int64_t code = 0;
        const core::json::Value* code_value = error->Find("code");
        if (code_value != nullptr && core::json::TryGetInteger(*code_value, code)) {
          call->error.code = static_cast<int>(code);
        }
        std::string message_text;
        std::string ignored;
        core::json::ReadString(*error, "message", message_text, false, ignored);
        call->error.message = message_text;
        core::json::ReadOptionalString(*error, "data", call->error.data, ignored);
        call->ok = false;
      } else {
        const core::json::Value* result = message.Find("result");
        call->result = result != nullptr ? *result : core::json::MakeNull();
        call->ok = true;
      }
      call->done = true;
    }
    changed.notify_all();
    return;
  }

  std::string method;
  std::string ignored;
  if (!core::json::ReadString(message, "method", method, true, ignored)) {
    return;
  }
  const core::json::Value* params_member = message.Find("params");
  const core::json::Value params =
      params_member != nullptr ? *params_member : core::json::MakeObject();

  NotificationHandler callback;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (method == "server.connected") {
      core::json::ReadString(params, "connectionId", connection_id, false, ignored);
    }
    notifications.emplace_back(method, params);
    if (notifications.size() > kMaxQueuedNotifications) {
      notifications.pop_front();
    }
    callback = handler;
  }
  changed.notify_all();
  if (callback) {
    callback(method, params);
  }
}

void BridgeClient::Impl::OnDisconnected(std::optional<std::uint16_t> code) {
  std::map<std::int64_t, std::shared_ptr<PendingCall>> failed;
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (closed) {
      return;
    }
    closed = true;
    open = false;
    close_code = code;
    failed.swap(pending);
    for (auto& [id, call] : failed) {
      call->done = true;
      call->ok = false;
      call->error.Set(core::errors::RpcErrorCode::kInternalError, "Connection closed");
    }
  }
  changed.notify_all();
}

bool BridgeClient::Impl::SendFrame(std::string frame, std::string& error) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    if (!open) {
      error = "Connection closed";
      return false;
    }
  }
  stream->Send(std::make_shared<const std::string>(std::move(frame)));
  return true;
}

BridgeClient::BridgeClient(core::logging::Logger logger)
    : impl_(std::make_shared<Impl>(std::move(logger))) {}

BridgeClient::~BridgeClient() {
  Close();
}

bool BridgeClient::Connect(const ClientOptions& options, std::string& error) {
  Impl& impl = *impl_;
  if (impl.stream != nullptr) {
    error = "client is already connected";
    return false;
  }

  GatewayUrl url;
  if (!ParseGatewayUrl(options.url, url, error)) {
    return false;
  }
  impl.request_timeout = options.request_timeout;
  {
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.open = false;
    impl.closed = false;
    impl.close_code.reset();
    impl.connection_id.clear();
    impl.notifications.clear();
  }
  impl.io.restart();
  if (url.tls) {
    if (!transport::ConfigureClientTls(impl.tls, options.insecure_tls, error)) {
      return false;
    }
    impl.stream = std::make_unique<ClientStreamImpl<TlsStream>>(impl, asio::make_strand(impl.io),
                                                                impl.tls);
  } else {
    impl.stream =
        std::make_unique<ClientStreamImpl<PlainStream>>(impl, asio::make_strand(impl.io));
  }

  impl.work.emplace(asio::make_work_guard(impl.io));
  impl.thread = std::thread([&impl]() { impl.io.run(); });

  bool finished = false;
  std::string open_error;
  impl.stream->Open(url, options, [&impl, &finished, &open_error](const std::string& failure) {
    {
      std::lock_guard<std::mutex> lock(impl.mutex);
      finished = true;
      open_error = failure;
      impl.open = failure.empty();
    }
    impl.changed.notify_all();
  });

  std::unique_lock<std::mutex> lock(impl.mutex);
  // The socket layer enforces connect_timeout; the extra margin covers the
  // TLS and HTTP upgrade round trips.
  const bool signalled = impl.changed.wait_for(lock, options.connect_timeout * 2,
                                               [&finished]() { return finished; });
  if (!signalled || !open_error.empty()) {
    error = signalled ? open_error : "connect timeout: " + options.url;
    lock.unlock();
    Close();
    return false;
  }
  impl.logger.Debug("connected to gateway", {{"url", options.url}});
  return true;
}

void BridgeClient::Close() {
  Impl& impl = *impl_;
  if (!impl.thread.joinable()) {
    return;
  }
  bool was_open = false;
  {
    std::lock_guard<std::mutex> lock(impl.mutex);
    was_open = impl.open;
  }
  if (was_open) {
    impl.stream->Close();
    std::unique_lock<std::mutex> lock(impl.mutex);
    impl.changed.wait_for(lock, std::chrono::seconds(2), [&impl]() { return impl.closed; });
  }
  impl.OnDisconnected(std::nullopt);
  impl.work.reset();
  impl.io.stop();
  impl.thread.join();
  impl.stream.reset();
}

bool BridgeClient::IsOpen() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->open;
}

void BridgeClient::SetNotificationHandler(NotificationHandler handler) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->handler = std::move(handler);
}

bool BridgeClient::Call(const std::string& method, core::json::Value params,
                        core::json::Value& result, core::errors::RpcError& error,
                        std::optional<std::chrono::milliseconds> timeout) {
  Impl& impl = *impl_;
  const std::int64_t id = ++impl.next_id;
  auto call = std::make_shared<PendingCall>();

  core::json::Value request = core::json::MakeObject();
  request.Set("jsonrpc", core::json::MakeString(std::string(rpc::kJsonRpcVersion)));
  request.Set("id", core::json::MakeNumber(static_cast<double>(id)));
  request.Set("method", core::json::MakeString(method));
  request.Set("params", std::move(params));

  {
    std::lock_guard<std::mutex> lock(impl.mutex);
    if (!impl.open) {
      error.Set(core::errors::RpcErrorCode::kInternalError, "Connection closed");
      return false;
    }
    impl.pending.emplace(id, call);
  }
  std::string send_error;
  if (!impl.SendFrame(core::json::Serialize(request), send_error)) {
    std::lock_guard<std::mutex> lock(impl.mutex);
    impl.pending.erase(id);
    error.Set(core::errors::RpcErrorCode::kInternalError, send_error);
    return false;
  }

  std::unique_lock<std::mutex> lock(impl.mutex);
  const bool answered = impl.changed.wait_for(lock, timeout.value_or(impl.request_timeout),
                                              [&call]() { return call->done; });
  if (!answered) {
    impl.pending.erase(id);
    error.Set(core::errors::RpcErrorCode::kInternalError, "Request timeout: " + method);
    return false;
  }
  if (!call->ok) {
    error = call->error;
    return false;
  }
  result = std::move(call->result);
  return true;
}

bool BridgeClient::Notify(const std::string& method, core::json::Value params,
                          std::string& error) {
  return impl_->SendFrame(rpc::BuildNotification(method, std::move(params)), error);
}

bool BridgeClient::SendRaw(const std::string& frame, std::string& error) {
  return impl_->SendFrame(frame, error);
}

bool BridgeClient::WaitForNotification(const std::string& method,
                                       std::chrono::milliseconds timeout,
                                       core::json::Value& params) {
  Impl& impl = *impl_;
  std::unique_lock<std::mutex> lock(impl.mutex);
  auto take = [&impl, &method, &params]() {
    for (auto it = impl.notifications.begin(); it != impl.notifications.end(); ++it) {
      if (it->first == method) {
        params = std::move(it->second);
        impl.notifications.erase(it);
        return true;
      }
    }
    return false;
  };
  return impl.changed.wait_for(lock, timeout, take);
}

std::optional<std::uint16_t> BridgeClient::WaitForClose(std::chrono::milliseconds timeout) {
  Impl& impl = *impl_;
  std::unique_lock<std::mutex> lock(impl.mutex);
  if (!impl.changed.wait_for(lock, timeout, [&impl]() { return impl.closed; })) {
    return std::nullopt;
  }
  return impl.close_code;
}

std::string BridgeClient::ConnectionId() const {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  return impl_->connection_id;
}

} // namespace hwbridge::client
