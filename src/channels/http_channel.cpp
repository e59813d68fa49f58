#include "http_channel.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>

namespace chime {

static const char* WEB_UI_HTML = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
<meta charset="UTF-8">
<meta name="viewport" content="width=device-width, initial-scale=1.0">
<title>Chime</title>
<style>
body{font-family:system-ui,sans-serif;margin:0;padding:16px;background:#0a0e17;color:#e0e6ed}
h1{font-size:18px;color:#00e5ff}
form,#chat{display:flex;gap:8px;margin:12px 0;flex-wrap:wrap}
input,select,button{padding:8px;border-radius:6px;border:1px solid #1e2d4a;background:#111827;color:inherit}
button{background:#00e5ff;color:#000;cursor:pointer}
table{border-collapse:collapse;width:100%}
td,th{border-bottom:1px solid #1e2d4a;padding:6px;text-align:left;font-size:14px}
#reply{white-space:pre-wrap;color:#39ff14;margin:8px 0}
.err{color:#ff4757}
</style>
</head>
<body>
<h1>Chime reminders</h1>
<form id="add">
  <input id="message" placeholder="What?" required>
  <input id="when" placeholder="4pm, in 20 minutes, tomorrow 9:00" required>
  <select id="recurrence">
    <option value="none">once</option><option value="daily">daily</option><option value="weekly">weekly</option>
  </select>
  <button>Add</button>
</form>
<div id="chat"><input id="say" placeholder="remind me at 4pm to water the plants" size="40"><button id="send">Say</button></div>
<div id="reply"></div>
<table><thead><tr><th>#</th><th>Message</th><th>When (UTC)</th><th>Repeat</th><th>Status</th><th></th></tr></thead><tbody id="rows"></tbody></table>
<script>
const rows=document.getElementById('rows'),reply=document.getElementById('reply');
function esc(s){return String(s).replace(/&/g,'&amp;').replace(/</g,'&lt;').replace(/>/g,'&gt;');}
function show(text,bad){reply.textContent=text;reply.className=bad?'err':'';}
async function load(){
  const r=await fetch('/reminders?status=all');const j=await r.json();
  rows.innerHTML=j.reminders.map(x=>'<tr><td>'+x.id+'</td><td>'+esc(x.message)+'</td><td>'+x.fire_at_iso+'</td><td>'+x.recurrence+'</td><td>'+x.status+'</td><td>'+
    (x.status==='pending'?'<button onclick="cancelR('+x.id+')">Cancel</button>':'')+'</td></tr>').join('');
}
async function cancelR(id){const r=await fetch('/reminders/'+id,{method:'DELETE'});const j=await r.json();show(j.error||('Cancelled #'+id),!r.ok);load();}
document.getElementById('add').addEventListener('submit',async e=>{
  e.preventDefault();
  const body={message:document.getElementById('message').value,when:document.getElementById('when').value,recurrence:document.getElementById('recurrence').value};
  const r=await fetch('/reminders',{method:'POST',headers:{'Content-Type':'application/json'},body:JSON.stringify(body)});
  const j=await r.json();show(r.ok?('Added #'+j.id+' for '+j.fire_at_iso):j.error,!r.ok);load();
});
document.getElementById('send').addEventListener('click',async()=>{
  const text=document.getElementById('say').value;if(!text)return;
  const r=await fetch('/chat',{method:'POST',headers:{'Content-Type':'application/json'},body:JSON.stringify({text:text,speaker:'web'})});
  const j=await r.json();show(j.reply||j.error,!r.ok);load();
});
load();setInterval(load,5000);
</script>
</body>
</html>)HTML";

static void json_reply(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

static nlohmann::json error_body(const std::string& msg) {
    nlohmann::json j;
    j["error"] = msg;
    return j;
}

// Route ids are digit runs; one too large for int64 names no reminder.
static bool parse_id(const std::string& digits, int64_t& id) {
    try {
        id = std::stoll(digits);
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

void HTTPChannel::start(CommandHandler handler) {
    if (!config_.enabled) return;
    handler_ = std::move(handler);
    register_routes();

    thread_ = std::thread([this]() {
        std::cerr << "[http] Listening on " << host_ << ":" << port_ << "\n";
        if (!server_.listen(host_, port_)) {
            std::cerr << "[http] Failed to listen on " << host_ << ":" << port_ << "\n";
        }
    });
}

void HTTPChannel::stop() {
    server_.stop();
    if (thread_.joinable()) thread_.join();
}

void HTTPChannel::register_routes() {
    server_.set_payload_max_length(kMaxPayloadBytes);

    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(WEB_UI_HTML, "text/html");
    });

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });

    // Maps the error taxonomy onto HTTP statuses for every route.
    server_.set_exception_handler([](const httplib::Request&, httplib::Response& res, std::exception_ptr ep) {
        try {
            if (ep) std::rethrow_exception(ep);
            json_reply(res, 500, error_body("unknown error"));
        } catch (const ParseError& e) {
            nlohmann::json j = error_body(e.what());
            j["text"] = e.text();
            json_reply(res, 400, j);
        } catch (const std::invalid_argument& e) {
            json_reply(res, 400, error_body(e.what()));
        } catch (const nlohmann::json::exception& e) {
            json_reply(res, 400, error_body(e.what()));
        } catch (const NotFound& e) {
            json_reply(res, 404, error_body(e.what()));
        } catch (const InvalidTransition& e) {
            json_reply(res, 409, error_body(e.what()));
        } catch (const StoreError& e) {
            std::cerr << "[http] Store error: " << e.what() << "\n";
            json_reply(res, 503, error_body(e.what()));
        } catch (const std::exception& e) {
            std::cerr << "[http] Unhandled exception: " << e.what() << "\n";
            json_reply(res, 500, error_body(e.what()));
        } catch (...) {
            std::cerr << "[http] Unhandled non-std exception\n";
            json_reply(res, 500, error_body("non-std exception"));
        }
    });

    server_.Get("/reminders", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        ReminderFilter filter;
        std::string status = req.has_param("status") ? req.get_param_value("status") : "pending";
        if (status != "all") filter.status = parse_status(status);

        nlohmann::json out;
        out["reminders"] = nlohmann::json::array();
        for (auto& r : service_.list_reminders(filter)) {
            out["reminders"].push_back(r.to_json());
        }
        json_reply(res, 200, out);
    });

    server_.Post("/reminders", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        if (!check_rate_limit(res)) return;

        nlohmann::json j = nlohmann::json::parse(req.body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            json_reply(res, 400, error_body("invalid JSON in request body"));
            return;
        }
        std::string message = j.value("message", "");
        std::string when = j.value("when", "");
        std::string recurrence = j.value("recurrence", "none");

        int64_t id = service_.create_reminder(message, when, recurrence);
        json_reply(res, 201, service_.get_reminder(id).to_json());
    });

    server_.Get(R"(/reminders/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        int64_t id = 0;
        if (!parse_id(req.matches[1].str(), id)) {
            json_reply(res, 404, error_body("reminder not found"));
            return;
        }
        json_reply(res, 200, service_.get_reminder(id).to_json());
    });

    server_.Delete(R"(/reminders/(\d+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        if (!check_rate_limit(res)) return;
        int64_t id = 0;
        if (!parse_id(req.matches[1].str(), id)) {
            json_reply(res, 404, error_body("reminder not found"));
            return;
        }
        service_.cancel_reminder(id);
        nlohmann::json out;
        out["id"] = id;
        out["status"] = "cancelled";
        json_reply(res, 200, out);
    });

    server_.Post("/chat", [this](const httplib::Request& req, httplib::Response& res) {
        if (!check_auth(req, res)) return;
        if (!check_rate_limit(res)) return;

        nlohmann::json j = nlohmann::json::parse(req.body, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            json_reply(res, 400, error_body("invalid JSON in request body"));
            return;
        }

        Utterance msg;
        msg.channel = j.value("channel", "http");
        msg.speaker = j.value("speaker", "anonymous");
        msg.text = j.value("text", "");

        nlohmann::json resp;
        resp["reply"] = handler_(msg);
        json_reply(res, 200, resp);
    });
}

bool HTTPChannel::check_auth(const httplib::Request& req, httplib::Response& res) {
    if (config_.api_key.empty()) return true;

    auto auth = req.get_header_value("Authorization");
    if (auth != "Bearer " + config_.api_key) {
        json_reply(res, 401, error_body("unauthorized"));
        return false;
    }
    return true;
}

bool HTTPChannel::check_rate_limit(httplib::Response& res) {
    if (!rate_limiter_.allow()) {
        json_reply(res, 429, error_body("rate limit exceeded"));
        return false;
    }
    return true;
}

} // namespace chime
