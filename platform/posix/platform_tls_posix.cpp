#include "platform_tls.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <climits>
#include <memory>
#include <mutex>
#include <sys/stat.h>

namespace loco::platform::tls {

namespace {

struct SslCtxDeleter {
  void operator()(SSL_CTX* ctx) const { SSL_CTX_free(ctx); }
};
struct SslDeleter {
  void operator()(SSL* ssl) const { SSL_free(ssl); }
};

struct Connection {
  std::unique_ptr<SSL_CTX, SslCtxDeleter> ctx;
  std::unique_ptr<SSL, SslDeleter> ssl;
  bool peer_closed{false};
};

bool InitOpenSsl() {
  static std::once_flag once;
  static bool ok = false;
  std::call_once(once, [] { ok = OPENSSL_init_ssl(0, nullptr) == 1; });
  return ok;
}

std::string TakeOpenSslError(const char* what) {
  const unsigned long code = ERR_get_error();
  ERR_clear_error();
  if (code == 0) {
    return what;
  }
  char buf[256] = {};
  ERR_error_string_n(code, buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

bool LoadTrust(SSL_CTX* ctx, const std::string& ca_path, std::string& error) {
  if (ca_path.empty()) {
    if (SSL_CTX_set_default_verify_paths(ctx) != 1) {
      error = TakeOpenSslError("tls system trust store unavailable");
      return false;
    }
    return true;
  }
  struct stat st {};
  if (::stat(ca_path.c_str(), &st) != 0) {
    error = "tls ca bundle not found: " + ca_path;
    return false;
  }
  const bool is_dir = S_ISDIR(st.st_mode);
  if (SSL_CTX_load_verify_locations(ctx, is_dir ? nullptr : ca_path.c_str(),
                                    is_dir ? ca_path.c_str() : nullptr) != 1) {
    error = TakeOpenSslError("tls ca bundle load failed");
    return false;
  }
  return true;
}

net::IoStatus MapSslResult(Connection& conn, int ret) {
  const int err = SSL_get_error(conn.ssl.get(), ret);
  switch (err) {
    case SSL_ERROR_ZERO_RETURN:
      conn.peer_closed = true;
      return net::IoStatus::kClosed;
    case SSL_ERROR_WANT_READ:
    case SSL_ERROR_WANT_WRITE:
      return net::IoStatus::kTimeout;
    case SSL_ERROR_SYSCALL:
      ERR_clear_error();
      if (ret == 0 || net::SocketWasReset()) {
        conn.peer_closed = true;
        return net::IoStatus::kClosed;
      }
      return net::SocketWouldBlock() ? net::IoStatus::kTimeout
                                     : net::IoStatus::kError;
    case SSL_ERROR_SSL:
#if defined(SSL_R_UNEXPECTED_EOF_WHILE_READING)
      if (ERR_GET_REASON(ERR_peek_error()) ==
          SSL_R_UNEXPECTED_EOF_WHILE_READING) {
        ERR_clear_error();
        conn.peer_closed = true;
        return net::IoStatus::kClosed;
      }
#endif
      ERR_clear_error();
      return net::IoStatus::kError;
    default:
      ERR_clear_error();
      return net::IoStatus::kError;
  }
}

Connection* Get(ClientContext& ctx) {
  return static_cast<Connection*>(ctx.impl);
}

}  // namespace

bool ClientHandshake(net::Socket sock, const std::string& host,
                     const ClientVerifyConfig& verify,
                     ClientContext& ctx,
                     net::IoStatus& status,
                     std::string& error) {
  status = net::IoStatus::kError;
  error.clear();
  if (ctx.impl) {
    error = "tls context already in use";
    return false;
  }
  if (!InitOpenSsl()) {
    error = "openssl init failed";
    return false;
  }

  auto conn = std::make_unique<Connection>();
  conn->ctx.reset(SSL_CTX_new(TLS_client_method()));
  if (!conn->ctx) {
    error = TakeOpenSslError("SSL_CTX_new failed");
    return false;
  }
  SSL_CTX* sctx = conn->ctx.get();
  SSL_CTX_set_options(sctx, SSL_OP_NO_COMPRESSION | SSL_OP_NO_RENEGOTIATION);
  if (SSL_CTX_set_min_proto_version(sctx, TLS1_2_VERSION) != 1) {
    error = TakeOpenSslError("tls minimum version rejected");
    return false;
  }
  if (verify.verify_peer) {
    if (!LoadTrust(sctx, verify.ca_bundle_path, error)) {
      return false;
    }
    SSL_CTX_set_verify(sctx, SSL_VERIFY_PEER, nullptr);
  } else {
    SSL_CTX_set_verify(sctx, SSL_VERIFY_NONE, nullptr);
  }

  conn->ssl.reset(SSL_new(sctx));
  if (!conn->ssl) {
    error = TakeOpenSslError("SSL_new failed");
    return false;
  }
  SSL* ssl = conn->ssl.get();
  SSL_set_mode(ssl, SSL_MODE_AUTO_RETRY);
  if (!host.empty() && SSL_set_tlsext_host_name(ssl, host.c_str()) != 1) {
    error = TakeOpenSslError("tls sni setup failed");
    return false;
  }
  if (verify.verify_peer && verify.verify_hostname) {
    if (host.empty()) {
      error = "tls hostname verification needs a host";
      return false;
    }
    if (SSL_set1_host(ssl, host.c_str()) != 1) {
      error = TakeOpenSslError("tls host verify setup failed");
      return false;
    }
  }
  if (SSL_set_fd(ssl, sock) != 1) {
    error = TakeOpenSslError("SSL_set_fd failed");
    return false;
  }

  const int ret = SSL_connect(ssl);
  if (ret != 1) {
    // SO_RCVTIMEO expiry shows up as EAGAIN under SSL_ERROR_SYSCALL.
    const bool would_block = net::SocketWouldBlock();
    const int ssl_err = SSL_get_error(ssl, ret);
    if (ssl_err == SSL_ERROR_WANT_READ || ssl_err == SSL_ERROR_WANT_WRITE ||
        (ssl_err == SSL_ERROR_SYSCALL && ret < 0 && would_block)) {
      ERR_clear_error();
      status = net::IoStatus::kTimeout;
      error = "tls handshake timed out";
      return false;
    }
    const long verdict = SSL_get_verify_result(ssl);
    if (verify.verify_peer && verdict != X509_V_OK) {
      ERR_clear_error();
      error = "tls certificate rejected for " + host + ": " +
              X509_verify_cert_error_string(verdict);
    } else {
      error = TakeOpenSslError("tls handshake failed");
    }
    return false;
  }

  ctx.impl = conn.release();
  status = net::IoStatus::kOk;
  return true;
}

net::IoStatus Write(ClientContext& ctx, const std::uint8_t* data,
                    std::size_t len) {
  Connection* conn = Get(ctx);
  if (!conn) {
    return net::IoStatus::kError;
  }
  while (len > 0) {
    const int step = len > static_cast<std::size_t>(INT_MAX)
                         ? INT_MAX
                         : static_cast<int>(len);
    const int ret = SSL_write(conn->ssl.get(), data, step);
    if (ret <= 0) {
      return MapSslResult(*conn, ret);
    }
    data += ret;
    len -= static_cast<std::size_t>(ret);
  }
  return net::IoStatus::kOk;
}

net::IoStatus Read(ClientContext& ctx, std::uint8_t* data, std::size_t len,
                   std::size_t& out_read) {
  out_read = 0;
  Connection* conn = Get(ctx);
  if (!conn) {
    return net::IoStatus::kError;
  }
  if (!data || len == 0) {
    return net::IoStatus::kOk;
  }
  const int step = len > static_cast<std::size_t>(INT_MAX)
                       ? INT_MAX
                       : static_cast<int>(len);
  const int ret = SSL_read(conn->ssl.get(), data, step);
  if (ret <= 0) {
    return MapSslResult(*conn, ret);
  }
  out_read = static_cast<std::size_t>(ret);
  return net::IoStatus::kOk;
}

void Close(ClientContext& ctx) {
  Connection* conn = Get(ctx);
  if (!conn) {
    return;
  }
  // close_notify is best effort; a peer that already hung up gets none.
  if (!conn->peer_closed && SSL_shutdown(conn->ssl.get()) < 0) {
    ERR_clear_error();
  }
  delete conn;
  ctx.impl = nullptr;
}

}  // namespace loco::platform::tls
