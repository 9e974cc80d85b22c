#pragma once

#include <chrono>
#include <map>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/optional.hpp>

#include "document_processor.hpp"

#ifndef BOOST_BEAST_READ_HEADER_BUFFER
#define BOOST_BEAST_READ_HEADER_BUFFER 8192
#endif

#ifndef PDF_SPLITTER_REQUEST_TIMEOUT_SECONDS
#define PDF_SPLITTER_REQUEST_TIMEOUT_SECONDS 60
#endif

class http_worker {
  public:
    // disable copy constructor and copy assignment (non-copyable)
    http_worker(http_worker const&) = delete;
    http_worker& operator=(http_worker const&) = delete;

    // options apply to every request, a "start" parameter overrides the start page
    http_worker(boost::asio::ip::tcp::acceptor& acceptor, Processor_Options options);

    void start();

  private:
    using request_body_t = boost::beast::http::string_body;

    // The acceptor used to listen for incoming connections.
    boost::asio::ip::tcp::acceptor& acceptor_;

    Processor_Options options_;

    // The socket for the currently connected client.
    boost::asio::ip::tcp::socket socket_{acceptor_.get_executor()};

    // The buffer for performing reads
    boost::beast::flat_static_buffer<BOOST_BEAST_READ_HEADER_BUFFER> buffer_;

    // The parser for reading the requests
    boost::optional<boost::beast::http::request_parser<request_body_t>> parser_;

    // The timer putting a time limit on requests.
    boost::asio::steady_timer request_deadline_{acceptor_.get_executor(), (std::chrono::steady_clock::time_point::max)()};

    // The string-based response message.
    boost::optional<boost::beast::http::response<boost::beast::http::string_body>> string_response_;

    // The string-based response serializer.
    boost::optional<boost::beast::http::response_serializer<boost::beast::http::string_body>> string_serializer_;

    void accept();

    void read_request();

    void process_request(boost::beast::http::request<request_body_t> const& req);

    void send_response(boost::beast::http::status status, std::string const& content_type, std::string body);

    void send_bad_response(boost::beast::http::status status, std::string const& error);

    void check_deadline();
};

// "%41+b" -> "A b"; false on a truncated or non-hex escape
bool url_decode(const std::string& in, std::string& out);

// key=value pairs of the query part of a request target, values are still url-encoded
std::map<std::string, std::string> parse_query(const std::string& target);
