#include <iostream>
#include <string>
#include <map>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <microhttpd.h>
#include "../include/config.hpp"
#include "../include/http_api.hpp"
#include "../include/log.hpp"
#include "../include/queue_manager.hpp"

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static volatile std::sig_atomic_t g_stop = 0;

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, const HttpReply& r) {
    struct MHD_Response* resp = MHD_create_response_from_buffer(r.body.size(), (void*)r.body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, r.content_type.c_str());
    MhdResult ret = MHD_queue_response(conn, r.status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static std::map<std::string,std::string> parse_query(struct MHD_Connection* conn) {
    std::map<std::string,std::string> out;
    MHD_get_connection_values(conn, MHD_GET_ARGUMENT_KIND,
        [](void* cls, enum MHD_ValueKind, const char* key, const char* val) -> MhdResult {
            auto* m = static_cast<std::map<std::string,std::string>*>(cls);
            (*m)[key ? key : ""] = val ? val : "";
            return MHD_YES;
        }, &out);
    return out;
}

static MhdResult handler(void* cls, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    auto* api = static_cast<QueueHttpApi*>(cls);
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (*upload_data_size) {
        ci->body.append(upload_data, *upload_data_size);
        *upload_data_size = 0;
        return MHD_YES;
    }

    HttpRequest req{ci->method, ci->url, parse_query(connection), ci->body};
    return send_response(connection, api->handle(req));
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*conn*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static void usage() {
    std::cerr << "agentq_queue usage:\n"
              << "  agentq_queue [--db <dbfile>] [--port N] [--no-recover]\n";
}

int main(int argc, char** argv) {
    QueueConfig cfg;
    bool recover = true;
    try {
        cfg = QueueConfig::from_env();
        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            if (a == "--db" && i + 1 < argc) cfg.db_path = argv[++i];
            else if (a == "--port" && i + 1 < argc) cfg.port = std::stoi(argv[++i]);
            else if (a == "--no-recover") recover = false;
            else { usage(); return 2; }
        }
    } catch (const std::exception& e) {
        std::cerr << "[queue] ERROR: " << e.what() << "\n";
        return 2;
    }
    set_log_level(cfg.log_level);

    try {
        QueueManager queue(cfg.db_path, cfg.retry_policy());
        if (recover) queue.recover_orphaned();
        QueueHttpApi api(queue, cfg.default_max_retries, cfg.stuck_after);

        log_info("queue", "Starting HTTP server on port " + std::to_string(cfg.port) + " (db " + cfg.db_path + ")");
        struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD,
                                                static_cast<uint16_t>(cfg.port), nullptr, nullptr,
                                                &handler, &api,
                                                MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                                MHD_OPTION_END);
        if (!d) {
            log_error("queue", "Failed to start HTTP server");
            return 1;
        }
        std::signal(SIGTERM, [](int){ g_stop = 1; });
        std::signal(SIGINT, [](int){ g_stop = 1; });
        while (!g_stop) pause();
        log_info("queue", "Shutting down");
        MHD_stop_daemon(d);
    } catch (const std::exception& e) {
        log_error("queue", e.what());
        return 1;
    }
    return 0;
}
