#include "gateway.hpp"
#include "embedding_provider.hpp"
#include "errors.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>

namespace convmem {

static std::atomic<bool> g_running{true};

static void signal_handler(int) {
    g_running = false;
}

static void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static void send_error(httplib::Response& res, int status, const std::string& message, const std::string& kind) {
    nlohmann::json err;
    err["error"] = message;
    err["kind"] = kind;
    send_json(res, err, status);
}

static int status_for(ProviderErrorKind kind) {
    switch (kind) {
    case ProviderErrorKind::timeout:   return 504;
    case ProviderErrorKind::cancelled: return 503;
    default:                           return 502;
    }
}

// Runs a handler body and maps store/provider errors onto HTTP responses.
template <typename Fn>
static void guarded(const char* route, httplib::Response& res, Fn&& fn) {
    try {
        fn();
    } catch (const ProviderError& e) {
        std::cerr << "[gateway] " << route << " provider error: " << e.what() << "\n";
        send_error(res, status_for(e.kind()), e.what(), to_string(e.kind()));
    } catch (const DimensionMismatch& e) {
        std::cerr << "[gateway] " << route << " configuration error: " << e.what() << "\n";
        send_error(res, 500, e.what(), "dimension_mismatch");
    } catch (const DuplicateTurn& e) {
        send_error(res, 409, e.what(), "duplicate_turn");
    } catch (const nlohmann::json::exception& e) {
        send_error(res, 400, std::string("invalid JSON: ") + e.what(), "bad_request");
    } catch (const std::invalid_argument& e) {
        send_error(res, 400, e.what(), "bad_request");
    } catch (const std::exception& e) {
        std::cerr << "[gateway] " << route << " error: " << e.what() << "\n";
        send_error(res, 500, e.what(), "internal");
    }
}

static nlohmann::json parse_body(const httplib::Request& req) {
    if (req.body.empty()) return nlohmann::json::object();
    auto j = nlohmann::json::parse(req.body);
    if (!j.is_object()) throw std::invalid_argument("request body must be a JSON object");
    return j;
}

static size_t read_count(const nlohmann::json& body, const char* key, size_t fallback) {
    if (!body.contains(key) || body[key].is_null()) return fallback;
    auto& v = body[key];
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }
    return v.get<size_t>();
}

static MetadataFilter read_filter(const nlohmann::json& body) {
    MetadataFilter filter;
    if (!body.contains("tables") || body["tables"].is_null()) return filter;
    if (!body["tables"].is_array()) throw std::invalid_argument("tables must be an array of strings");
    std::set<std::string> tables;
    for (auto& t : body["tables"]) {
        if (!t.is_string()) throw std::invalid_argument("tables must be an array of strings");
        tables.insert(t.get<std::string>());
    }
    filter.tables = std::move(tables);
    return filter;
}

MemoryGateway::MemoryGateway(StoreRegistry& registry, const Config& cfg)
    : registry_(registry)
    , config_(cfg)
    , rate_limiter_(cfg.gateway.rate_limit_rpm) {}

MemoryGateway::~MemoryGateway() {
    stop();
}

EmbedOptions MemoryGateway::embed_options() const {
    EmbedOptions opts;
    opts.timeout = std::chrono::milliseconds(config_.embedding.timeout_ms);
    return opts;
}

bool MemoryGateway::check_auth(const httplib::Request& req, httplib::Response& res) {
    if (config_.gateway.api_key.empty()) return true;
    auto auth = req.get_header_value("Authorization");
    if (auth != "Bearer " + config_.gateway.api_key) {
        send_error(res, 401, "unauthorized", "auth");
        return false;
    }
    return true;
}

bool MemoryGateway::check_rate_limit(const httplib::Request& req, httplib::Response& res) {
    if (!rate_limiter_.allow(req.remote_addr)) {
        send_error(res, 429, "rate limit exceeded", "rate_limit");
        return false;
    }
    return true;
}

void MemoryGateway::setup_routes() {
    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        std::string msg = "unknown error";
        try { if (ep) std::rethrow_exception(ep); }
        catch (const std::exception& e) { msg = e.what(); }
        catch (...) { msg = "non-std exception"; }
        std::cerr << "[gateway] Unhandled exception: " << msg << "\n";
        send_error(res, 500, msg, "internal");
    });

    server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        nlohmann::json j;
        j["status"] = "ok";
        j["provider"] = registry_.provider().tag().str();
        j["conversations"] = registry_.size();
        send_json(res, j);
    });

    server_.Post(R"(/conversations/([^/]+)/turns)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        guarded("/turns", res, [&]() {
            ConversationTurn turn = ConversationTurn::from_json(parse_body(req));
            auto store = registry_.get(req.matches[1]);
            size_t index = store->add(std::move(turn), embed_options());
            auto stored = store->get_turn(index);

            nlohmann::json j;
            j["index"] = index;
            j["size"] = store->size();
            if (stored) j["id"] = stored->id;
            send_json(res, j, 201);
        });
    });

    server_.Post(R"(/conversations/([^/]+)/search)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        guarded("/search", res, [&]() {
            auto body = parse_body(req);
            std::string query = body.value("query", "");
            size_t k = read_count(body, "k", static_cast<size_t>(config_.retrieval.top_k));

            std::set<size_t> exclude;
            if (body.contains("exclude") && !body["exclude"].is_null()) {
                if (!body["exclude"].is_array()) throw std::invalid_argument("exclude must be an array of indices");
                for (auto& v : body["exclude"]) {
                    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
                        throw std::invalid_argument("exclude must be an array of indices");
                    }
                    exclude.insert(v.get<size_t>());
                }
            }

            auto store = registry_.get(req.matches[1]);
            auto results = store->search(query, k, exclude, read_filter(body), embed_options());

            nlohmann::json arr = nlohmann::json::array();
            for (auto& r : results) {
                arr.push_back({
                    {"index", r.index},
                    {"similarity", r.similarity},
                    {"turn", r.turn.to_json(false)}
                });
            }
            nlohmann::json j;
            j["results"] = arr;
            send_json(res, j);
        });
    });

    server_.Get(R"(/conversations/([^/]+)/recent)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        guarded("/recent", res, [&]() {
            size_t n = static_cast<size_t>(config_.retrieval.recent_window);
            if (req.has_param("n")) {
                std::string raw = req.get_param_value("n");
                try {
                    size_t pos = 0;
                    n = std::stoul(raw, &pos);
                    if (pos != raw.size()) throw std::invalid_argument(raw);
                } catch (const std::exception&) {
                    throw std::invalid_argument("n must be a non-negative integer");
                }
            }

            auto window = registry_.get(req.matches[1])->recent_window(n);
            nlohmann::json arr = nlohmann::json::array();
            for (size_t i = 0; i < window.turns.size(); i++) {
                auto t = window.turns[i].to_json(false);
                t["index"] = window.first_index + i;
                arr.push_back(std::move(t));
            }
            nlohmann::json j;
            j["turns"] = arr;
            j["size"] = window.total;
            send_json(res, j);
        });
    });

    server_.Post(R"(/conversations/([^/]+)/context)", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        guarded("/context", res, [&]() {
            auto body = parse_body(req);
            std::string question = body.value("question", "");

            RetrievalOptions opts;
            opts.recent_window = static_cast<size_t>(config_.retrieval.recent_window);
            opts.top_k = read_count(body, "k", static_cast<size_t>(config_.retrieval.top_k));
            opts.filter = read_filter(body);
            opts.embed = embed_options();

            auto store = registry_.get(req.matches[1]);
            HybridContext ctx = retrieve_context(*store, question, opts);

            nlohmann::json j = ctx.to_json();
            j["prompt"] = format_context_for_prompt(ctx);
            send_json(res, j);
        });
    });

    auto clear = [this](const std::string& id, const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res) || !check_rate_limit(req, res)) return;
        bool existed = registry_.clear_conversation(id);
        nlohmann::json j;
        j["success"] = true;
        j["existed"] = existed;
        j["message"] = "Cleared conversation history for: " + id;
        send_json(res, j);
    };
    server_.Post(R"(/clear/([^/]+))", [clear](const httplib::Request& req, httplib::Response& res) {
        clear(req.matches[1], req, res);
    });
    server_.Post("/clear", [clear](const httplib::Request& req, httplib::Response& res) {
        clear("default", req, res);
    });
}

bool MemoryGateway::start(const std::string& host, int port) {
    setup_routes();
    host_ = host;

    if (port == 0) {
        port_ = server_.bind_to_any_port(host_);
        if (port_ <= 0) {
            std::cerr << "[gateway] Failed to bind " << host_ << " on any port\n";
            return false;
        }
    } else {
        if (!server_.bind_to_port(host_, port)) {
            std::cerr << "[gateway] Failed to bind " << host_ << ":" << port << "\n";
            return false;
        }
        port_ = port;
    }

    thread_ = std::thread([this]() {
        std::cerr << "[gateway] Listening on " << host_ << ":" << port_ << "\n";
        server_.listen_after_bind();
    });
    // stop() is a no-op until the accept loop runs.
    for (int i = 0; i < 500 && !server_.is_running(); i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return true;
}

void MemoryGateway::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

int cmd_serve(const std::string& config_path, const std::string& host, int port) {
    Config cfg = Config::load(config_path);
    std::string bind_host = host.empty() ? cfg.gateway.host : host;
    int bind_port = port > 0 ? port : cfg.gateway.port;

    std::shared_ptr<EmbeddingProvider> provider;
    try {
        provider = make_embedding_provider(cfg);
    } catch (const std::exception& e) {
        std::cerr << "[gateway] " << e.what() << "\n";
        return 1;
    }

    StoreRegistry registry(provider);
    MemoryGateway gateway(registry, cfg);
    if (!gateway.start(bind_host, bind_port)) return 1;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::cerr << "[gateway] Embedding provider: " << provider->tag().str() << "\n";
    std::cerr << "[gateway] Context: sliding window (last " << cfg.retrieval.recent_window
              << ") + semantic search (top " << cfg.retrieval.top_k << ")\n";
    std::cerr << "[gateway] Ready. Ctrl+C to quit.\n";

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cerr << "[gateway] Shutting down...\n";
    gateway.stop();
    std::cerr << "[gateway] Done.\n";
    return 0;
}

} // namespace convmem
