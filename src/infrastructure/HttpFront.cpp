/**
 * @file HttpFront.cpp
 * @brief Implementation of HttpFront.
 */

#include "infrastructure/HttpFront.hpp"
#include "domain/EngineErrors.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

namespace submitkit::infrastructure {

namespace {

// Multipart framing around the files; the dispatcher enforces the exact ceiling.
constexpr size_t kMultipartOverhead = 1024 * 1024;

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

HttpFront::HttpFront(application::OperationDispatcher& dispatcher,
                     ArtifactStore& store,
                     ExternalToolAdapter& tools,
                     Options options)
    : m_dispatcher(dispatcher), m_store(store), m_tools(tools), m_options(std::move(options)),
      m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpFront::~HttpFront() = default;

bool HttpFront::listen() {
    std::cout << "[HttpFront] Server running on http://" << m_options.host << ":" << m_options.port << std::endl;
    if (!m_server->listen(m_options.host, m_options.port)) {
        std::cerr << "[HttpFront] Could not bind " << m_options.host << ":" << m_options.port << std::endl;
        return false;
    }
    return true;
}

void HttpFront::stop() {
    m_server->stop();
}

application::OperationRequest HttpFront::BindRequest(application::Operation operation, const httplib::Request& req) {
    application::OperationRequest request;
    request.operation = operation;

    for (const auto& [name, part] : req.files) {
        if (name == "file" || name == "files") {
            domain::InputDocument doc;
            doc.bytes = part.content;
            doc.mediaType = part.content_type;
            doc.originalName = part.filename;
            request.inputs.push_back(std::move(doc));
        } else {
            request.params[name] = part.content;
        }
    }
    for (const auto& [name, value] : req.params) {
        request.params.emplace(name, value);
    }
    return request;
}

std::string HttpFront::ContentTypeFor(const std::string& name) {
    const std::string ext = Lower(std::filesystem::path(name).extension().string());
    if (ext == ".pdf") return "application/pdf";
    if (ext == ".docx") return "application/vnd.openxmlformats-officedocument.wordprocessingml.document";
    return "application/octet-stream";
}

void HttpFront::registerRoutes() {
    m_server->set_payload_max_length(static_cast<size_t>(m_options.maxUploadBytes) + kMultipartOverhead);
    m_server->set_read_timeout(300, 0);
    m_server->set_write_timeout(300, 0);

    m_server->set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        return httplib::Server::HandlerResponse::Unhandled;
    });
    m_server->Options(".*", [](const httplib::Request&, httplib::Response& res) {
        res.status = 204;
    });

    const application::Operation operations[] = {
        application::Operation::Compress,   application::Operation::Merge,
        application::Operation::Split,      application::Operation::Organise,
        application::Operation::Rotate,     application::Operation::ImageToPdf,
        application::Operation::Metadata,   application::Operation::Validate,
        application::Operation::Rename,     application::Operation::PdfToWord,
    };
    for (application::Operation operation : operations) {
        const std::string route = "/api/" + application::OperationName(operation);
        m_server->Post(route, [this, operation](const httplib::Request& req, httplib::Response& res) {
            handleOperation(operation, req, res);
        });
    }

    m_server->Get(R"(/download/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        handleDownload(req, res);
    });

    m_server->Get("/", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json body = {
            {"status", "ok"},
            {"service", "SubmitKit"},
            {"ghostscript", m_tools.isProbed() && m_tools.reductionTool().has_value()},
        };
        SendJson(res, 200, body);
    });

    m_server->set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            std::cerr << "[HttpFront] Unhandled error on " << req.path << ": " << e.what() << std::endl;
        }
        SendJson(res, 500, {{"error", "Internal server error"}});
    });
}

void HttpFront::handleOperation(application::Operation operation, const httplib::Request& req, httplib::Response& res) {
    application::DispatchResponse response = m_dispatcher.handle(BindRequest(operation, req));
    SendJson(res, response.statusCode, response.body);
}

void HttpFront::handleDownload(const httplib::Request& req, httplib::Response& res) {
    const std::string name = req.matches[1];
    std::string bytes;
    try {
        bytes = m_store.get(name);
    } catch (const domain::ArtifactNotFound&) {
        SendJson(res, 404, {{"error", "File not found or expired"}});
        return;
    }

    // Present the name without its random token.
    const std::string display = name.substr(name.find('_') + 1);
    res.set_header("Content-Disposition", "attachment; filename=\"" + display + "\"");
    res.set_content(bytes, ContentTypeFor(name));
}

} // namespace submitkit::infrastructure
