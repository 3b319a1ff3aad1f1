#include "capwire/dispatcher.hpp"
#include "capwire/error.hpp"
#include "capwire/log.hpp"
#include "capwire/schema.hpp"
#include <stdexcept>

namespace capwire {

namespace {

DispatchError invalid_params(const std::string& message) {
    return DispatchError(error::InvalidParams, std::string(error_kind::InvalidParams), message);
}

std::string context_value(const nlohmann::json& v) {
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

} // namespace

Dispatcher::Dispatcher(CapabilityRegistry& registry)
    : Dispatcher(registry, Options{}) {}

Dispatcher::Dispatcher(CapabilityRegistry& registry, Options opts)
    : registry_(registry)
    , opts_(std::move(opts)) {
    setup_handlers();
}

void Dispatcher::on_request(const std::string& method, MethodHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Dispatcher::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

void Dispatcher::set_authorizer(std::shared_ptr<IAuthorizer> authorizer) {
    std::lock_guard<std::mutex> lock(mutex_);
    authorizer_ = std::move(authorizer);
}

void Dispatcher::use(std::shared_ptr<IMiddleware> middleware) {
    if (!middleware) {
        throw ConfigurationError(ConfigurationError::Kind::InvalidHandler, "Null middleware");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    middleware_.push_back(std::move(middleware));
}

bool Dispatcher::has_method(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0;
}

void Dispatcher::setup_handlers() {
    on_request("initialize", [this](const nlohmann::json& params, const CallContext& ctx) {
        if (params.is_object() && params.contains("clientInfo") && params.at("clientInfo").is_object()) {
            const auto& info = params.at("clientInfo");
            logger()->info("session {} initialized by {} {}", ctx.session_id,
                           info.value("name", std::string("?")), info.value("version", std::string("?")));
        }

        InitializeResult result;
        result.protocol_version = std::string(PROTOCOL_VERSION);
        result.server_info = opts_.server_info;
        if (registry_.size(Category::Tool) > 0) result.capabilities.tools = nlohmann::json::object();
        if (registry_.size(Category::Resource) > 0) result.capabilities.resources = nlohmann::json::object();
        if (registry_.size(Category::Prompt) > 0) result.capabilities.prompts = nlohmann::json::object();

        nlohmann::json j;
        to_json(j, result);
        return j;
    });

    on_request("ping", [](const nlohmann::json&, const CallContext&) {
        return nlohmann::json::object();
    });

    on_request("tools/list", [this](const nlohmann::json& params, const CallContext&) {
        return list(Category::Tool, "tools", params);
    });
    on_request("resources/list", [this](const nlohmann::json& params, const CallContext&) {
        return list(Category::Resource, "resources", params);
    });
    on_request("prompts/list", [this](const nlohmann::json& params, const CallContext&) {
        return list(Category::Prompt, "prompts", params);
    });

    on_request("tools/call", [this](const nlohmann::json& params, const CallContext& ctx) {
        return invoke(Category::Tool, "tools/call", params, ctx);
    });
    on_request("resources/read", [this](const nlohmann::json& params, const CallContext& ctx) {
        return invoke(Category::Resource, "resources/read", params, ctx);
    });
    on_request("prompts/get", [this](const nlohmann::json& params, const CallContext& ctx) {
        return invoke(Category::Prompt, "prompts/get", params, ctx);
    });

    on_notification("notifications/initialized", [](const nlohmann::json&, const CallContext& ctx) {
        logger()->debug("session {} ready", ctx.session_id);
    });
}

nlohmann::json Dispatcher::list(Category category, const char* key, const nlohmann::json& params) const {
    std::optional<std::string> cursor;
    if (params.is_object()) {
        auto it = params.find("cursor");
        if (it != params.end() && !it->is_null()) {
            if (!it->is_string()) throw invalid_params("'cursor' must be a string");
            cursor = it->get<std::string>();
        }
    }

    std::pair<std::vector<CapabilityEntry>, std::optional<std::string>> page;
    try {
        page = registry_.page(category, cursor, opts_.page_size);
    } catch (const std::logic_error&) {
        throw invalid_params("Invalid cursor: " + cursor.value_or(""));
    }

    nlohmann::json items = nlohmann::json::array();
    for (const auto& entry : page.first) items.push_back(entry.descriptor);

    nlohmann::json result = {{key, items}};
    if (page.second) result["nextCursor"] = *page.second;
    return result;
}

nlohmann::json Dispatcher::invoke(Category category, const std::string& method,
                                  const nlohmann::json& params, const CallContext& ctx) {
    if (!params.is_object()) throw invalid_params("Parameters must be an object");

    const char* key = category == Category::Resource ? "uri" : "name";
    auto it = params.find(key);
    if (it == params.end()) {
        throw DispatchError(error::InvalidParams, std::string(error_kind::MissingParameter),
                            std::string("Missing required parameter '") + key + "'");
    }
    if (!it->is_string()) throw invalid_params(std::string("'") + key + "' must be a string");
    const std::string name = it->get<std::string>();

    // Resolve
    auto entry = registry_.resolve(category, name);
    if (!entry) {
        throw DispatchError(error::MethodNotFound, std::string(error_kind::MethodNotFound),
                            "Unknown " + std::string(to_string(category)) + ": " + name,
                            nlohmann::json{{"name", name}});
    }

    // Validate
    nlohmann::json args = nlohmann::json::object();
    if (category == Category::Resource) {
        args = params;
    } else if (auto a = params.find("arguments"); a != params.end() && !a->is_null()) {
        args = *a;
    }
    if (auto violation = SchemaValidator::validate(entry->schema, args)) {
        throw DispatchError(error::InvalidParams, violation->kind, violation->message);
    }

    authorize(*entry, method, params, ctx);

    // Execute
    nlohmann::json result;
    try {
        switch (category) {
            case Category::Tool:
                to_json(result, std::get<ToolHandler>(entry->handler)(args));
                break;
            case Category::Resource: {
                auto contents = std::get<ResourceReadHandler>(entry->handler)(name);
                result = {{"contents", contents}};
                break;
            }
            case Category::Prompt:
                to_json(result, std::get<PromptGetHandler>(entry->handler)(name, args));
                break;
        }
    } catch (const DispatchError&) {
        throw;
    } catch (const std::exception& e) {
        logger()->error("{} '{}' failed: {}", to_string(category), name, e.what());
        throw DispatchError(error::InternalError, std::string(error_kind::InternalError), e.what());
    } catch (...) {
        logger()->error("{} '{}' threw a non-standard exception", to_string(category), name);
        throw DispatchError(error::InternalError, std::string(error_kind::InternalError),
                            "Handler for " + std::string(to_string(category)) + " '" + name
                            + "' failed with an unknown exception");
    }
    return result;
}

void Dispatcher::authorize(const CapabilityEntry& entry, const std::string& method,
                           const nlohmann::json& params, const CallContext& ctx) {
    std::shared_ptr<IAuthorizer> authorizer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        authorizer = authorizer_;
    }
    if (!authorizer) return;

    std::string subject = ctx.subject_id.value_or(opts_.default_subject);
    std::map<std::string, std::string> context;

    if (auto c = params.find("context"); c != params.end() && c->is_object()) {
        for (const auto& [k, v] : c->items()) {
            if (v.is_string() || v.is_number() || v.is_boolean()) context[k] = context_value(v);
        }
    }
    if (auto a = params.find("auth"); a != params.end() && a->is_object()) {
        if (auto s = a->find("subject_id"); s != a->end() && s->is_string()) subject = s->get<std::string>();
        if (auto u = a->find("user_id"); u != a->end() && u->is_string()) context["user_id"] = u->get<std::string>();
    }
    context["method"] = method;
    context["session_id"] = ctx.session_id;
    if (ctx.client_ip) context["client_ip"] = *ctx.client_ip;

    if (!authorizer->check(subject, entry.category, entry.name, context)) {
        logger()->warn("permission denied: subject '{}' on {} '{}'", subject,
                       to_string(entry.category), entry.name);
        throw DispatchError(error::PermissionDenied, std::string(error_kind::PermissionDenied),
                            "Permission denied for " + std::string(to_string(entry.category))
                            + " '" + entry.name + "'",
                            nlohmann::json{{"subject_id", subject}});
    }
}

JsonRpcResponse Dispatcher::dispatch(const JsonRpcRequest& request, const CallContext& ctx) {
    MethodHandler handler;
    std::vector<std::shared_ptr<IMiddleware>> middleware;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = request_handlers_.find(request.method);
        if (it != request_handlers_.end()) handler = it->second;
        middleware = middleware_;
    }

    JsonRpcResponse response;
    response.id = request.id;
    try {
        for (const auto& m : middleware) m->before_request(request, ctx);
        if (!handler) {
            throw DispatchError(error::MethodNotFound, std::string(error_kind::MethodNotFound),
                                "Method not found: " + request.method);
        }
        response.result = handler(request.params.value_or(nlohmann::json::object()), ctx);
    } catch (const DispatchError& e) {
        response.error = make_error(e.code(), e.kind(), e.what(), e.data());
    } catch (const std::exception& e) {
        logger()->error("{} id={} failed: {}", request.method, to_string(request.id), e.what());
        response.error = make_error(error::InternalError, error_kind::InternalError, e.what());
    } catch (...) {
        logger()->error("{} id={} failed with a non-standard exception", request.method,
                        to_string(request.id));
        response.error = make_error(error::InternalError, error_kind::InternalError,
                                    "Unknown exception in " + request.method);
    }

    for (const auto& m : middleware) {
        try {
            if (response.error) m->on_error(request, *response.error, ctx);
            m->after_response(request, response, ctx);
        } catch (const std::exception& e) {
            logger()->warn("middleware failed after {}: {}", request.method, e.what());
        } catch (...) {
            logger()->warn("middleware failed after {} with a non-standard exception", request.method);
        }
    }
    return response;
}

void Dispatcher::handle_notification(const JsonRpcNotification& notification, const CallContext& ctx) {
    NotificationHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = notification_handlers_.find(notification.method);
        if (it == notification_handlers_.end()) {
            logger()->debug("ignoring notification {}", notification.method);
            return;
        }
        handler = it->second;
    }
    try {
        handler(notification.params.value_or(nlohmann::json::object()), ctx);
    } catch (const std::exception& e) {
        logger()->warn("notification {} failed: {}", notification.method, e.what());
    } catch (...) {
        logger()->warn("notification {} failed with a non-standard exception", notification.method);
    }
}

} // namespace capwire
