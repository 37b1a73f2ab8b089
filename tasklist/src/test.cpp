#include <tasklist/mcp.hpp>
#include <iostream>
#include <sstream>
#include <cassert>
#include <cctype>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <set>
#include <thread>
#include <chrono>
#include <vector>
#include <string>

using namespace tasklist;
using json = nlohmann::json;

// Build and run one JSON-RPC call through the handler
json call(mcp::Handler& handler, const std::string& method, const json& params, int id) {
    json request = {
        {"jsonrpc", "2.0"},
        {"method", method},
        {"params", params},
        {"id", id}
    };
    std::string response = handler.handle(request.dump());
    assert(!response.empty());
    return json::parse(response);
}

json call_tool(mcp::Handler& handler, const std::string& name, const json& args, int id) {
    return call(handler, "tools/call", {{"name", name}, {"arguments", args}}, id);
}

// The record (or array) carried in a successful tools/call response
json tool_payload(const json& response) {
    assert(response.contains("result"));
    assert(response["result"]["isError"] == false);
    const auto& content = response["result"]["content"];
    assert(content.is_array() && content.size() == 1);
    assert(content[0]["type"] == "text");
    return json::parse(content[0]["text"].get<std::string>());
}

std::string tool_text(const json& response) {
    assert(response.contains("result"));
    return response["result"]["content"][0]["text"].get<std::string>();
}

void test_timestamp_format() {
    std::cout << "Testing timestamp formatting..." << std::endl;

    assert(format_timestamp(0) == "1970-01-01T00:00:00.000000Z");
    assert(format_timestamp(1700000000123456LL) == "2023-11-14T22:13:20.123456Z");
    assert(format_timestamp(-1) == "1969-12-31T23:59:59.999999Z");

    Timestamp t = now();
    assert(advance_timestamp(t) > t);
    // A timestamp from the future still moves forward
    Timestamp future = t + 3600LL * 1000000;
    assert(advance_timestamp(future) == future + 1);

    std::cout << "  PASS" << std::endl;
}

void test_id_generator() {
    std::cout << "Testing IdGenerator..." << std::endl;

    IdGenerator ids(42);
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        std::string id = ids.next();
        assert(id.size() == 36);
        assert(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-');
        assert(id[14] == '4');
        assert(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b');
        seen.insert(id);
    }
    assert(seen.size() == 1000);

    std::cout << "  PASS" << std::endl;
}

void test_id_collision_retry() {
    std::cout << "Testing TaskStore id collision retry..." << std::endl;

    // Hands out "dup" three times before anything else
    std::vector<std::string> sequence = {"dup", "dup", "dup", "second", "dup", "third"};
    size_t next = 0;
    TaskStore store([&sequence, &next] { return sequence[next++]; });

    TaskRecord first = store.create("first");
    assert(first.id == "dup");

    TaskRecord second = store.create("second");
    assert(second.id == "second");
    assert(next == 4);  // both clashes were skipped

    // Once "dup" is gone it may be handed out again
    assert(store.remove(first.id).ok());
    TaskRecord reused = store.create("reused");
    assert(reused.id == "dup");

    TaskRecord third = store.create("third");
    assert(third.id == "third");
    assert(next == sequence.size());

    auto tasks = store.list();
    assert(tasks.size() == 3);
    assert(tasks[0].id == "second");
    assert(tasks[1].id == "dup");
    assert(tasks[1].title == "reused");
    assert(tasks[2].id == "third");

    std::cout << "  PASS" << std::endl;
}

void test_create_and_get() {
    std::cout << "Testing TaskStore create/get..." << std::endl;

    TaskStore store;
    TaskRecord created = store.create("Buy milk");
    assert(!created.id.empty());
    assert(created.title == "Buy milk");
    assert(!created.description.has_value());
    assert(!created.completed);
    assert(created.created_at == created.updated_at);

    auto fetched = store.get(created.id);
    assert(fetched.ok());
    assert(fetched.value().id == created.id);
    assert(fetched.value().title == "Buy milk");
    assert(!fetched.value().description.has_value());
    assert(!fetched.value().completed);
    assert(fetched.value().created_at == fetched.value().updated_at);

    // Same input, new id
    TaskRecord again = store.create("Buy milk");
    assert(again.id != created.id);
    assert(store.size() == 2);

    // Titles are not validated
    TaskRecord blank = store.create("");
    assert(blank.title.empty());

    std::cout << "  PASS" << std::endl;
}

void test_update_partial() {
    std::cout << "Testing TaskStore partial update..." << std::endl;

    TaskStore store;
    TaskRecord task = store.create("Write report", std::string("quarterly numbers"));

    TaskPatch only_completed;
    only_completed.completed = true;
    auto updated = store.update(task.id, only_completed);
    assert(updated.ok());
    assert(updated.value().title == "Write report");
    assert(updated.value().description == std::optional<std::string>("quarterly numbers"));
    assert(updated.value().completed);
    assert(updated.value().updated_at > task.updated_at);
    assert(updated.value().created_at == task.created_at);
    assert(updated.value().id == task.id);

    TaskPatch rename;
    rename.title = "Write annual report";
    rename.description = "";
    auto renamed = store.update(task.id, rename);
    assert(renamed.ok());
    assert(renamed.value().title == "Write annual report");
    // Replaced with empty text, not cleared
    assert(renamed.value().description.has_value());
    assert(renamed.value().description->empty());
    assert(renamed.value().completed);
    assert(renamed.value().updated_at > updated.value().updated_at);

    TaskPatch reopen;
    reopen.completed = false;
    auto reopened = store.update(task.id, reopen);
    assert(reopened.ok());
    assert(!reopened.value().completed);

    // An empty patch still counts as a mutation
    auto touched = store.update(task.id, TaskPatch{});
    assert(touched.ok());
    assert(touched.value().updated_at > reopened.value().updated_at);

    std::cout << "  PASS" << std::endl;
}

void test_not_found() {
    std::cout << "Testing TaskStore not-found handling..." << std::endl;

    TaskStore store;
    TaskRecord task = store.create("Exact match only");

    auto missing = store.get("nonexistent-id");
    assert(!missing.ok());
    assert(missing.error().category == StoreErrc::NotFound);
    assert(missing.error().context.at("id") == "nonexistent-id");

    // No prefix or case-insensitive matching
    assert(!store.get(task.id.substr(0, 8)).ok());
    std::string upper = task.id;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper != task.id) {
        assert(!store.get(upper).ok());
    }

    TaskPatch patch;
    patch.title = "x";
    assert(store.update("nonexistent-id", patch).error().category == StoreErrc::NotFound);
    assert(store.complete("nonexistent-id").error().category == StoreErrc::NotFound);
    assert(store.remove("nonexistent-id").error().category == StoreErrc::NotFound);

    // Failed operations leave the store alone
    assert(store.size() == 1);
    assert(store.get(task.id).value().title == "Exact match only");

    std::cout << "  PASS" << std::endl;
}

void test_delete() {
    std::cout << "Testing TaskStore delete..." << std::endl;

    TaskStore store;
    TaskRecord task = store.create("Temporary");

    auto removed = store.remove(task.id);
    assert(removed.ok());
    assert(removed.value() == task.id);
    assert(store.size() == 0);

    auto fetched = store.get(task.id);
    assert(!fetched.ok());
    assert(fetched.error().category == StoreErrc::NotFound);

    auto again = store.remove(task.id);
    assert(!again.ok());
    assert(again.error().category == StoreErrc::NotFound);
    assert(again.error().context.at("id") == task.id);

    std::cout << "  PASS" << std::endl;
}

void test_list_order() {
    std::cout << "Testing TaskStore list order..." << std::endl;

    TaskStore store;
    assert(store.list().empty());

    TaskRecord a = store.create("A");
    TaskRecord b = store.create("B");
    TaskRecord c = store.create("C");

    assert(store.remove(b.id).ok());

    auto tasks = store.list();
    assert(tasks.size() == 2);
    assert(tasks[0].id == a.id);
    assert(tasks[1].id == c.id);

    // Updates don't move records
    TaskPatch patch;
    patch.title = "A2";
    assert(store.update(a.id, patch).ok());
    tasks = store.list();
    assert(tasks[0].title == "A2");
    assert(tasks[1].id == c.id);

    std::cout << "  PASS" << std::endl;
}

void test_complete() {
    std::cout << "Testing TaskStore complete..." << std::endl;

    TaskStore store;
    TaskRecord task = store.create("Finish me", std::string("soon"));

    auto done = store.complete(task.id);
    assert(done.ok());
    assert(done.value().completed);
    assert(done.value().title == "Finish me");
    assert(done.value().description == std::optional<std::string>("soon"));
    assert(done.value().updated_at > task.updated_at);
    assert(done.value().created_at == task.created_at);

    // Completing twice is allowed and refreshes updated_at again
    auto twice = store.complete(task.id);
    assert(twice.ok());
    assert(twice.value().completed);
    assert(twice.value().updated_at > done.value().updated_at);

    std::cout << "  PASS" << std::endl;
}

void test_snapshots_are_copies() {
    std::cout << "Testing TaskStore returns copies..." << std::endl;

    TaskStore store;
    TaskRecord task = store.create("Original");

    auto tasks = store.list();
    tasks[0].title = "Changed outside";
    tasks[0].completed = true;

    auto fetched = store.get(task.id);
    fetched.value().title = "Also changed outside";

    auto current = store.get(task.id);
    assert(current.value().title == "Original");
    assert(!current.value().completed);

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_creates() {
    std::cout << "Testing TaskStore concurrent creates..." << std::endl;

    auto store = std::make_shared<TaskStore>();
    const int num_threads = 8;
    const int per_thread = 200;

    std::vector<std::vector<std::string>> ids(num_threads);
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([store, t, &ids] {
            for (int i = 0; i < per_thread; ++i) {
                auto task = store->create("task " + std::to_string(t) + "-" + std::to_string(i));
                ids[t].push_back(task.id);
                // Every fourth one is deleted again
                if (i % 4 == 0) {
                    auto removed = store->remove(task.id);
                    assert(removed.ok());
                }
            }
        });
    }
    for (auto& th : threads) th.join();

    std::set<std::string> unique;
    for (const auto& list : ids) {
        unique.insert(list.begin(), list.end());
    }
    assert(unique.size() == static_cast<size_t>(num_threads * per_thread));

    size_t deletes = static_cast<size_t>(num_threads * (per_thread / 4));
    auto tasks = store->list();
    assert(tasks.size() == static_cast<size_t>(num_threads * per_thread) - deletes);
    assert(store->size() == tasks.size());

    std::set<std::string> live;
    for (const auto& task : tasks) {
        live.insert(task.id);
    }
    assert(live.size() == tasks.size());

    std::cout << "  PASS" << std::endl;
}

void test_concurrent_mutations() {
    std::cout << "Testing TaskStore concurrent mutations..." << std::endl;

    auto store = std::make_shared<TaskStore>();
    TaskRecord task = store->create("Shared");

    const int num_threads = 6;
    const int per_thread = 300;
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([store, t, &task] {
            Timestamp last_seen = 0;
            for (int i = 0; i < per_thread; ++i) {
                StoreResult<TaskRecord> result = (t % 2 == 0)
                    ? store->complete(task.id)
                    : [&] {
                          TaskPatch patch;
                          patch.title = "title from " + std::to_string(t);
                          return store->update(task.id, patch);
                      }();
                assert(result.ok());
                assert(result.value().updated_at >= result.value().created_at);
                // Each writer observes strictly increasing updated_at
                assert(result.value().updated_at > last_seen);
                last_seen = result.value().updated_at;

                auto read = store->get(task.id);
                assert(read.ok());
                assert(read.value().id == task.id);
            }
        });
    }
    for (auto& th : threads) th.join();

    auto final_state = store->get(task.id);
    assert(final_state.ok());
    assert(final_state.value().completed);
    assert(final_state.value().created_at == task.created_at);
    assert(final_state.value().updated_at >= task.created_at + num_threads * per_thread);
    assert(store->size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_tool_argument_decoding() {
    std::cout << "Testing task tool argument decoding..." << std::endl;

    TaskStore store;
    namespace tasks = mcp::tools::tasks;

    auto missing_title = tasks::create_todo(&store, json::object());
    assert(!missing_title.ok());
    assert(missing_title.error_code == mcp::error::INVALID_PARAMS);
    assert(missing_title.content == "Missing required parameter: title");

    auto bad_title = tasks::create_todo(&store, {{"title", 5}});
    assert(bad_title.error_code == mcp::error::INVALID_PARAMS);
    assert(bad_title.content == "Invalid parameter type: title");
    assert(store.size() == 0);

    auto null_description = tasks::create_todo(&store, {{"title", "T"}, {"description", nullptr}});
    assert(null_description.ok());
    auto record = json::parse(null_description.content);
    assert(record["description"].is_null());

    std::string id = record["id"];
    auto bad_completed = tasks::update_todo(&store, {{"id", id}, {"completed", "yes"}});
    assert(bad_completed.error_code == mcp::error::INVALID_PARAMS);
    assert(bad_completed.content == "Invalid parameter type: completed");
    assert(!store.get(id).value().completed);

    auto missing_id = tasks::get_todo(&store, json::object());
    assert(missing_id.error_code == mcp::error::INVALID_PARAMS);
    assert(missing_id.content == "Missing required parameter: id");

    std::cout << "  PASS" << std::endl;
}

void test_serialization_failure() {
    std::cout << "Testing serialization failure mapping..." << std::endl;

    auto store = std::make_shared<TaskStore>();
    // Not valid UTF-8: stored fine, cannot be rendered as JSON text
    TaskRecord task = store->create("bad \xff\xfe title");

    auto direct = mcp::tools::tasks::get_todo(store.get(), {{"id", task.id}});
    assert(!direct.ok());
    assert(direct.error_code == mcp::error::INTERNAL_ERROR);
    assert(direct.content == "Serialization failed");
    assert(direct.error_data.contains("error"));
    assert(!direct.error_data["error"].get<std::string>().empty());

    mcp::Handler handler(store);
    auto response = call_tool(handler, "list_todos", json::object(), 1);
    assert(response.contains("error"));
    assert(response["error"]["code"] == mcp::error::INTERNAL_ERROR);
    assert(response["error"]["message"] == "Serialization failed");
    assert(response["error"]["data"].contains("error"));

    // The record exists; only its rendering failed
    assert(store->get(task.id).ok());

    std::cout << "  PASS" << std::endl;
}

void test_handler_initialize() {
    std::cout << "Testing Handler initialize/ping/tools list..." << std::endl;

    mcp::Handler handler(std::make_shared<TaskStore>());

    auto init = call(handler, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"capabilities", json::object()},
        {"clientInfo", {{"name", "test"}, {"version", "1.0"}}}
    }, 0);
    assert(init["jsonrpc"] == "2.0");
    assert(init["id"] == 0);
    const auto& result = init["result"];
    assert(result["protocolVersion"] == "2024-11-05");
    assert(result["capabilities"].contains("tools"));
    assert(result["serverInfo"]["name"] == "tasklist");
    assert(result["serverInfo"]["version"] == TASKLIST_VERSION);
    std::string instructions = result["instructions"];
    for (const char* name : {"list_todos", "create_todo", "update_todo",
                             "delete_todo", "get_todo", "complete_todo"}) {
        assert(instructions.find(name) != std::string::npos);
    }

    auto ping = call(handler, "ping", json::object(), 1);
    assert(ping["result"].is_object() && ping["result"].empty());

    auto list = call(handler, "tools/list", json::object(), 2);
    const auto& tools = list["result"]["tools"];
    assert(tools.size() == 6);
    std::set<std::string> names;
    for (const auto& tool : tools) {
        names.insert(tool["name"].get<std::string>());
        assert(tool["inputSchema"]["type"] == "object");
        assert(!tool["description"].get<std::string>().empty());
    }
    assert(names == std::set<std::string>({"list_todos", "create_todo", "update_todo",
                                           "delete_todo", "get_todo", "complete_todo"}));

    std::cout << "  PASS" << std::endl;
}

void test_handler_scenario() {
    std::cout << "Testing Handler todo scenario..." << std::endl;

    auto store = std::make_shared<TaskStore>();
    mcp::Handler handler(store);

    auto created = tool_payload(call_tool(handler, "create_todo", {{"title", "Buy milk"}}, 1));
    std::string id = created["id"];
    assert(id.size() == 36);
    assert(created["title"] == "Buy milk");
    assert(created["completed"] == false);
    assert(created["description"].is_null());
    assert(created["created_at"] == created["updated_at"]);

    auto completed = tool_payload(call_tool(handler, "complete_todo", {{"id", id}}, 2));
    assert(completed["completed"] == true);
    // Same-width RFC 3339 strings compare in time order
    assert(completed["updated_at"].get<std::string>() > created["updated_at"].get<std::string>());
    assert(completed["created_at"] == created["created_at"]);

    auto renamed = tool_payload(call_tool(handler, "update_todo",
                                          {{"id", id}, {"title", "Buy oat milk"}}, 3));
    assert(renamed["title"] == "Buy oat milk");
    assert(renamed["completed"] == true);
    assert(renamed["description"].is_null());

    auto described = tool_payload(call_tool(handler, "update_todo",
                                            {{"id", id}, {"description", "2 litres"},
                                             {"title", nullptr}}, 4));
    assert(described["title"] == "Buy oat milk");
    assert(described["description"] == "2 litres");

    auto fetched = tool_payload(call_tool(handler, "get_todo", {{"id", id}}, 5));
    assert(fetched == described);

    auto missing = call_tool(handler, "get_todo", {{"id", "nonexistent-id"}}, 6);
    assert(!missing.contains("result"));
    assert(missing["id"] == 6);
    assert(missing["error"]["code"] == mcp::error::INVALID_PARAMS);
    assert(missing["error"]["message"] == "Todo item with specified ID not found");
    assert(missing["error"]["data"]["id"] == "nonexistent-id");

    auto second = tool_payload(call_tool(handler, "create_todo",
                                         {{"title", "Walk dog"}, {"description", "twice"}}, 7));
    auto listed = tool_payload(call_tool(handler, "list_todos", json::object(), 8));
    assert(listed.is_array() && listed.size() == 2);
    assert(listed[0]["id"] == id);
    assert(listed[1]["id"] == second["id"]);

    auto deleted = call_tool(handler, "delete_todo", {{"id", id}}, 9);
    assert(tool_text(deleted) == "Successfully deleted todo item with ID " + id);

    auto deleted_again = call_tool(handler, "delete_todo", {{"id", id}}, 10);
    assert(deleted_again["error"]["code"] == mcp::error::INVALID_PARAMS);
    assert(deleted_again["error"]["data"]["id"] == id);

    for (const char* tool : {"update_todo", "complete_todo"}) {
        auto gone = call_tool(handler, tool, {{"id", id}, {"completed", false}}, 11);
        assert(gone["error"]["code"] == mcp::error::INVALID_PARAMS);
        assert(gone["error"]["data"]["id"] == id);
    }

    assert(store->size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_handler_protocol_errors() {
    std::cout << "Testing Handler protocol errors..." << std::endl;

    auto store = std::make_shared<TaskStore>();
    mcp::Handler handler(store);

    auto parse = json::parse(handler.handle("{not json"));
    assert(parse["error"]["code"] == mcp::error::PARSE_ERROR);
    assert(parse["id"].is_null());

    auto no_version = json::parse(handler.handle(R"({"method":"ping","id":1})"));
    assert(no_version["error"]["code"] == mcp::error::INVALID_REQUEST);
    assert(no_version["id"] == 1);

    auto not_object = json::parse(handler.handle("[1,2,3]"));
    assert(not_object["error"]["code"] == mcp::error::INVALID_REQUEST);

    auto unknown_method = call(handler, "resources/list", json::object(), 2);
    assert(unknown_method["error"]["code"] == mcp::error::METHOD_NOT_FOUND);

    auto unknown_tool = call_tool(handler, "archive_todo", {{"id", "x"}}, 3);
    assert(unknown_tool["error"]["code"] == mcp::error::TOOL_NOT_FOUND);
    assert(unknown_tool["error"]["message"] == "Unknown tool: archive_todo");

    auto no_name = call(handler, "tools/call", {{"arguments", json::object()}}, 4);
    assert(no_name["error"]["code"] == mcp::error::INVALID_PARAMS);

    // Notifications never get a response
    assert(handler.handle(R"({"jsonrpc":"2.0","method":"notifications/initialized"})").empty());
    assert(handler.handle(R"({"jsonrpc":"2.0","method":"tools/list"})").empty());

    // Object and array ids are not valid JSON-RPC ids and are not echoed
    auto object_id = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","method":"ping","id":{"x":1}})"));
    assert(!object_id.contains("result"));
    assert(object_id["error"]["code"] == mcp::error::INVALID_REQUEST);
    assert(object_id["id"].is_null());

    auto array_id = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"create_todo","arguments":{"title":"x"}},"id":[1]})"));
    assert(array_id["error"]["code"] == mcp::error::INVALID_REQUEST);
    assert(array_id["id"].is_null());
    assert(store->size() == 0);

    auto null_id = json::parse(handler.handle(R"({"jsonrpc":"2.0","method":"ping","id":null})"));
    assert(null_id.contains("result"));

    // String ids are echoed back as-is
    auto string_id = json::parse(handler.handle(
        R"({"jsonrpc":"2.0","method":"ping","id":"req-7"})"));
    assert(string_id["id"] == "req-7");

    std::cout << "  PASS" << std::endl;
}

void test_worker_pool() {
    std::cout << "Testing WorkerPool..." << std::endl;

    std::atomic<int> counter{0};
    {
        WorkerPool pool(4);
        assert(pool.size() == 4);
        for (int i = 0; i < 500; ++i) {
            assert(pool.submit([&counter] { counter++; }));
        }
        pool.wait_idle();
        assert(counter == 500);

        // A throwing job doesn't take its worker down
        assert(pool.submit([] { throw std::runtime_error("boom"); }));
        assert(pool.submit([&counter] { counter++; }));
        pool.wait_idle();
        assert(counter == 501);

        pool.shutdown();
        assert(!pool.submit([&counter] { counter++; }));
    }
    assert(counter == 501);

    WorkerPool single(0);
    assert(single.size() == 1);

    std::cout << "  PASS" << std::endl;
}

void test_server_stream() {
    std::cout << "Testing MCPServer over streams..." << std::endl;

    auto store = std::make_shared<TaskStore>();
    const int num_creates = 50;

    std::ostringstream requests;
    requests << R"({"jsonrpc":"2.0","method":"initialize","params":{"protocolVersion":"2024-11-05"},"id":0})" << "\n";
    requests << R"({"jsonrpc":"2.0","method":"notifications/initialized"})" << "\n";
    requests << "\n";
    for (int i = 1; i <= num_creates; ++i) {
        json req = {
            {"jsonrpc", "2.0"},
            {"method", "tools/call"},
            {"params", {{"name", "create_todo"}, {"arguments", {{"title", "item " + std::to_string(i)}}}}},
            {"id", i}
        };
        requests << req.dump() << "\n";
    }
    requests << "garbage\n";

    std::istringstream in(requests.str());
    std::ostringstream out;

    ServerOptions options;
    options.workers = 4;
    MCPServer server(store, options, in, out);
    server.run();

    assert(!server.running());
    assert(server.requests_received() == static_cast<size_t>(num_creates + 3));
    assert(server.requests_handled() == static_cast<size_t>(num_creates + 3));

    // One line per request with an id, plus the parse error
    std::istringstream lines(out.str());
    std::string line;
    std::set<int> answered;
    std::set<std::string> ids;
    int parse_errors = 0;
    while (std::getline(lines, line)) {
        auto response = json::parse(line);
        if (response.contains("error")) {
            assert(response["error"]["code"] == mcp::error::PARSE_ERROR);
            parse_errors++;
            continue;
        }
        int id = response["id"];
        answered.insert(id);
        if (id > 0) {
            ids.insert(tool_payload(response)["id"].get<std::string>());
        }
    }
    assert(parse_errors == 1);
    assert(answered.size() == static_cast<size_t>(num_creates + 1));
    assert(ids.size() == static_cast<size_t>(num_creates));
    assert(store->size() == static_cast<size_t>(num_creates));

    // A second session shares the same store
    std::istringstream in2(R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"list_todos"},"id":"list"})" "\n");
    std::ostringstream out2;
    MCPServer second(store, ServerOptions{1}, in2, out2);
    second.run();
    auto listed = tool_payload(json::parse(out2.str()));
    assert(listed.size() == static_cast<size_t>(num_creates));

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Tasklist Tests ===" << std::endl;
    std::cout << std::endl;

    // Expected failures below would otherwise flood stderr
    set_log_level(LogLevel::Error);

    test_timestamp_format();
    test_id_generator();
    test_id_collision_retry();
    test_create_and_get();
    test_update_partial();
    test_not_found();
    test_delete();
    test_list_order();
    test_complete();
    test_snapshots_are_copies();
    test_concurrent_creates();
    test_concurrent_mutations();
    test_tool_argument_decoding();
    test_serialization_failure();
    test_handler_initialize();
    test_handler_scenario();
    test_handler_protocol_errors();
    test_worker_pool();
    test_server_stream();

    std::cout << std::endl;
    std::cout << "=== All tests passed! ===" << std::endl;
    return 0;
}
