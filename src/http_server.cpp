#include "http_server.hpp"
#include "logging.hpp"
#include "outline_json.hpp"
#include "pdf_utils.hpp"

#include <cctype>
#include <regex>
#include <utility>

http_worker::http_worker(boost::asio::ip::tcp::acceptor& acceptor, Processor_Options options) :
    acceptor_(acceptor),
    options_(std::move(options)) {
}

void http_worker::start() {
    accept();
    check_deadline();
}

void http_worker::accept() {
    // Clean up any previous connection.
    boost::beast::error_code ec;
    socket_.close(ec);
    buffer_.consume(buffer_.size());

    acceptor_.async_accept(
        socket_,
    [this](boost::beast::error_code ec) {
        if (ec) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_HTTP) << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            boost::beast::error_code endpoint_ec;
            boost::asio::ip::tcp::endpoint remote = socket_.remote_endpoint(endpoint_ec);
            LOG_CHANNEL_INFO(LOG_CHANNEL_HTTP) << "Accepted request from " << remote.address() << ":" << remote.port();

            request_deadline_.expires_after(std::chrono::seconds(PDF_SPLITTER_REQUEST_TIMEOUT_SECONDS));

            read_request();
        }
    });
}

void http_worker::read_request() {
    // On each read the parser needs to be destroyed and
    // recreated. We store it in a boost::optional to
    // achieve that.
    parser_.emplace();

    boost::beast::http::async_read(socket_,
                                   buffer_,
                                   *parser_,
    [this](boost::beast::error_code ec, std::size_t) {
        if (ec) {
            LOG_CHANNEL_ERROR(LOG_CHANNEL_HTTP) << "Error code: " << ec.value() << " " << ec.message();
            accept();
        } else {
            process_request(parser_->get());
        }
    });
}

bool url_decode(const std::string& in, std::string& out)
{
    out.clear();
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            if (i + 3 > in.size() ||
                !std::isxdigit(static_cast<unsigned char>(in[i + 1])) ||
                !std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
                return false;
            }
            out += static_cast<char>(std::stoi(in.substr(i + 1, 2), nullptr, 16));
            i += 2;
        } else if (in[i] == '+') {
            out += ' ';
        } else {
            out += in[i];
        }
    }
    return true;
}

std::map<std::string, std::string> parse_query(const std::string& target) {
    std::map<std::string, std::string> data;
    std::string::size_type question_mark = target.find('?');
    std::string query = question_mark == std::string::npos ? target : target.substr(question_mark + 1);

    std::regex pattern("([\\w+%]+)=([^&]*)");
    auto words_begin = std::sregex_iterator(query.begin(), query.end(), pattern);
    auto words_end = std::sregex_iterator();

    for (std::sregex_iterator i = words_begin; i != words_end; i++) {
        data[(*i)[1].str()] = (*i)[2].str();
    }

    return data;
}

void http_worker::process_request(boost::beast::http::request<request_body_t> const& req) {
    switch (req.method()) {
        case boost::beast::http::verb::get: {
            /* request parameters:
             *   - required: path     : pdf file path
             *   - optional: start    : first page of the document body, 1-based
             *   - optional: warnings : 1 wraps the tree as {"outline": ..., "warnings": [...]}
             */
            std::map<std::string, std::string> params = parse_query(std::string(req.target()));

            std::string request_path;
            if (params.find("path") == params.end() || !url_decode(params.at("path"), request_path) || request_path.empty()) {
                send_bad_response(boost::beast::http::status::bad_request, "Missing or malformed 'path' parameter\r\n");
                return;
            }

            Processor_Options options = options_;
            if (params.find("start") != params.end()) {
                try {
                    options.start_page = std::stoi(params.at("start"));
                } catch (const std::exception&) {
                    send_bad_response(boost::beast::http::status::bad_request, "Malformed 'start' parameter\r\n");
                    return;
                }
            }
            bool with_warnings = params.find("warnings") != params.end() && params.at("warnings") == "1";

            LOG_CHANNEL_INFO(LOG_CHANNEL_HTTP) << "Processing PDF file: " << request_path << " from page " << options.start_page;

            std::optional<Processed_Document> document = process_pdf_file(request_path, options);
            std::string body = "{}";
            if (!document) {
                LOG_CHANNEL_ERROR(LOG_CHANNEL_HTTP) << "Cannot read " << request_path;
            } else if (with_warnings) {
                nlohmann::ordered_json json_response;
                json_response["outline"] = outline_to_json(document->outline);
                json_response["warnings"] = warnings_to_json(document->warnings);
                body = json_response.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
            } else {
                body = format_outline_tree(document->outline, -1);
            }

            send_response(boost::beast::http::status::ok, "application/json", std::move(body));
        }
        break;

        default:
            // We return responses indicating an error if
            // we do not recognize the request method.
            send_bad_response(
                boost::beast::http::status::bad_request,
                "Invalid request-method '" + std::string(req.method_string()) + "'\r\n");
            break;
    }
}

void http_worker::send_response(boost::beast::http::status status, std::string const& content_type, std::string body) {
    string_response_.emplace();
    string_response_->result(status);
    string_response_->keep_alive(false);
    string_response_->set(boost::beast::http::field::server, "pdf_splitter");
    string_response_->set(boost::beast::http::field::content_type, content_type);
    string_response_->body() = std::move(body);
    string_response_->prepare_payload();

    string_serializer_.emplace(*string_response_);

    boost::beast::http::async_write(
        socket_,
        *string_serializer_,
    [this](boost::beast::error_code ec, std::size_t) {
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        string_serializer_.reset();
        string_response_.reset();
        accept();
    });
}

void http_worker::send_bad_response(boost::beast::http::status status, std::string const& error) {
    LOG_CHANNEL_WARNING(LOG_CHANNEL_HTTP) << "Bad request: " << error;
    send_response(status, "text/plain", error);
}

void http_worker::check_deadline() {
    // The deadline may have moved, so check it has really passed.
    if (request_deadline_.expiry() <= std::chrono::steady_clock::now()) {
        // Close socket to cancel any outstanding operation.
        boost::beast::error_code ec;
        socket_.close(ec);

        // Sleep indefinitely until we're given a new deadline.
        request_deadline_.expires_at(
            std::chrono::steady_clock::time_point::max());
    }

    request_deadline_.async_wait(
    [this](boost::beast::error_code) {
        check_deadline();
    });
}
