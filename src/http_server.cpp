#include "http_server.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>

namespace {

constexpr std::size_t kFileSliceBytes = 64 * 1024;

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(asio::ip::tcp::socket sock,
              std::shared_ptr<HttpServer::Handler> handler,
              std::shared_ptr<Logger> logger)
    : socket_(std::move(sock)),
      handler_(std::move(handler)),
      logger_(std::move(logger)),
      read_buf_(kMaxHttpHeadBytes + kMaxHttpRequestBody) {}

  void start() { read_head(); }

private:
  void read_head() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\r\n\r\n",
      [this, self](std::error_code ec, std::size_t head_bytes){
        if(ec) {
          if(ec == asio::error::not_found) {
            respond(HttpResponse::error(431, "Request head too large"));
          } else if(ec != asio::error::eof) {
            log_debug(logger_.get(), "HTTP read error: {}", ec.message());
          }
          return;
        }
        std::string head(asio::buffers_begin(read_buf_.data()),
                         asio::buffers_begin(read_buf_.data()) + head_bytes - 4);
        read_buf_.consume(head_bytes);
        if(head.size() > kMaxHttpHeadBytes) {
          respond(HttpResponse::error(431, "Request head too large"));
          return;
        }
        try {
          request_ = parse_request_head(head);
        } catch(const std::invalid_argument& e) {
          respond(HttpResponse::error(400, e.what()));
          return;
        }
        std::optional<uint64_t> length;
        try {
          length = request_.content_length();
        } catch(const std::invalid_argument& e) {
          respond(HttpResponse::error(400, e.what()));
          return;
        }
        body_expected_ = length.value_or(0);
        if(body_expected_ > kMaxHttpRequestBody) {
          respond(HttpResponse::error(413, "Request body too large"));
          return;
        }
        read_body();
      });
  }

  void read_body() {
    if(read_buf_.size() >= body_expected_) {
      request_.body.assign(asio::buffers_begin(read_buf_.data()),
                           asio::buffers_begin(read_buf_.data()) + body_expected_);
      read_buf_.consume(body_expected_);
      dispatch();
      return;
    }
    auto self = shared_from_this();
    asio::async_read(socket_, read_buf_,
      asio::transfer_exactly(body_expected_ - read_buf_.size()),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          log_debug(logger_.get(), "HTTP body read error: {}", ec.message());
          return;
        }
        read_body();
      });
  }

  void dispatch() {
    HttpResponse response;
    try {
      response = (*handler_)(request_);
    } catch(const std::exception& e) {
      log_error(logger_.get(), "HTTP handler failed for {} {}: {}", request_.method, request_.path, e.what());
      response = HttpResponse::error(500, "Internal server error");
    }
    respond(std::move(response));
  }

  void respond(HttpResponse response) {
    response_ = std::move(response);
    if(response_.file) {
      file_.open(response_.file->path, std::ios::binary);
      if(!file_) {
        log_error(logger_.get(), "Unable to open {} for sending", response_.file->path.string());
        auto done = std::move(response_.on_complete);
        if(done) done(false);
        response_ = HttpResponse::error(500, "Transfer failed");
      } else {
        file_.seekg(static_cast<std::streamoff>(response_.file->offset));
        file_remaining_ = response_.file->length;
      }
    }
    head_ = serialize_response_head(response_);
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(head_),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          finish(false, ec.message());
          return;
        }
        if(response_.file) {
          write_file_slice();
          return;
        }
        asio::async_write(socket_, asio::buffer(response_.body),
          [this, self](std::error_code ec, std::size_t){
            finish(!ec, ec ? ec.message() : std::string());
          });
      });
  }

  void write_file_slice() {
    if(file_remaining_ == 0) {
      finish(true, {});
      return;
    }
    auto want = static_cast<std::size_t>(std::min<uint64_t>(file_remaining_, kFileSliceBytes));
    file_.read(slice_.data(), static_cast<std::streamsize>(want));
    auto got = static_cast<std::size_t>(file_.gcount());
    if(got == 0) {
      finish(false, "file ended early");
      return;
    }
    file_remaining_ -= got;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(slice_.data(), got),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          finish(false, ec.message());
          return;
        }
        write_file_slice();
      });
  }

  void finish(bool ok, const std::string& reason) {
    if(!ok) {
      log_warn(logger_.get(), "HTTP response for {} {} aborted: {}", request_.method, request_.path, reason);
    }
    if(response_.on_complete) {
      auto done = std::move(response_.on_complete);
      done(ok);
    }
    std::error_code ignored;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
    socket_.close(ignored);
  }

  asio::ip::tcp::socket socket_;
  std::shared_ptr<HttpServer::Handler> handler_;
  std::shared_ptr<Logger> logger_;
  asio::streambuf read_buf_;
  HttpRequest request_;
  uint64_t body_expected_ = 0;
  HttpResponse response_;
  std::string head_;
  std::ifstream file_;
  uint64_t file_remaining_ = 0;
  std::array<char, kFileSliceBytes> slice_{};
};

} // namespace

HttpServer::HttpServer(asio::io_context& io,
                       std::string listen_ip,
                       uint16_t port,
                       Handler handler,
                       std::shared_ptr<Logger> logger)
  : io_(io),
    listen_ip_(std::move(listen_ip)),
    port_(port),
    handler_(std::make_shared<Handler>(std::move(handler))),
    logger_(std::move(logger)),
    acceptor_(io) {
  if(!*handler_) throw std::invalid_argument("HttpServer needs a request handler");
}

HttpServer::~HttpServer() {
  std::error_code ec;
  acceptor_.close(ec);
}

void HttpServer::start() {
  if(running_) return;
  using tcp = asio::ip::tcp;
  std::error_code ec;
  auto address = asio::ip::make_address(listen_ip_, ec);
  if(ec) throw std::runtime_error("Invalid listen address '" + listen_ip_ + "': " + ec.message());
  tcp::endpoint endpoint(address, port_);
  acceptor_.open(endpoint.protocol(), ec);
  if(!ec) acceptor_.set_option(tcp::acceptor::reuse_address(true), ec);
  if(!ec) acceptor_.bind(endpoint, ec);
  if(!ec) acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  if(ec) {
    std::error_code ignored;
    acceptor_.close(ignored);
    throw std::runtime_error("Unable to listen on " + listen_ip_ + ":" + std::to_string(port_) + ": " + ec.message());
  }
  port_ = acceptor_.local_endpoint().port();
  running_ = true;
  log_info(logger_.get(), "Transfer HTTP server listening on {}:{}", listen_ip_, port_);
  do_accept();
}

void HttpServer::stop() {
  if(!running_) return;
  running_ = false;
  std::error_code ec;
  acceptor_.close(ec);
  log_info(logger_.get(), "Transfer HTTP server closed");
}

void HttpServer::do_accept() {
  acceptor_.async_accept([this](std::error_code ec, asio::ip::tcp::socket sock){
    if(ec) {
      if(ec != asio::error::operation_aborted) {
        log_error(logger_.get(), "Accept error: {}", ec.message());
      }
    } else {
      std::error_code rec;
      auto remote = sock.remote_endpoint(rec);
      if(!rec) log_debug(logger_.get(), "Accepted connection from {}", remote.address().to_string());
      std::make_shared<HttpSession>(std::move(sock), handler_, logger_)->start();
    }
    if(running_) do_accept();
  });
}
