#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "drover/common/fs.hpp"
#include "drover/common/json_util.hpp"
#include "drover/tools/builtin/builtins.hpp"
#include "drover/tools/builtin/complete_task.hpp"
#include "drover/tools/builtin/file_read.hpp"
#include "drover/tools/builtin/file_write.hpp"
#include "drover/tools/builtin/shell.hpp"
#include "drover/tools/schema_validator.hpp"
#include "drover/tools/tool_registry.hpp"

#include <chrono>
#include <thread>

namespace {

namespace tools = drover::tools;

tools::ToolArgs args_of(const std::string &json) {
  auto parsed = tools::parse_tool_args(json);
  if (!parsed.ok()) {
    throw std::runtime_error("bad test args: " + parsed.error());
  }
  return parsed.value();
}

tools::ToolContext context_for(const drover::testing::TempWorkspace &workspace) {
  tools::ToolContext ctx;
  ctx.workspace_path = workspace.path();
  ctx.agent_id = "test";
  ctx.call_id = "call_1";
  return ctx;
}

} // namespace

void register_tools_tests(std::vector<drover::tests::TestCase> &tests) {
  using drover::tests::require;
  namespace testing = drover::testing;

  tests.push_back({"tools_args_parse_and_serialize_canonically", [] {
                     const auto parsed = tools::parse_tool_args(R"({"b": 2, "a": "x", "c": {"k": [1]}})");
                     require(parsed.ok(), parsed.error());
                     require(tools::arg_string(parsed.value(), "a") == "x", "string arg");
                     require(tools::arg_int(parsed.value(), "b") == 2, "int arg");
                     require(!tools::arg_int(parsed.value(), "a").has_value(), "type mismatch");
                     require(tools::serialize_tool_args(parsed.value()) ==
                                 R"({"a":"x","b":2,"c":{"k": [1]}})",
                             "sorted keys: " + tools::serialize_tool_args(parsed.value()));
                     require(tools::parse_tool_args("  ").value().empty(), "blank means no args");
                     require(!tools::parse_tool_args("[1]").ok(), "array is rejected");
                     require(!tools::arg_int(args_of(R"({"n": 1.5})"), "n").has_value(),
                             "fractional is not an int");
                   }});

  tests.push_back({"tools_registry_lookup_is_case_insensitive_and_replaces", [] {
                     tools::ToolRegistry registry;
                     auto first = std::make_shared<testing::RecordingTool>("Echo");
                     auto second = std::make_shared<testing::RecordingTool>("echo");
                     registry.register_tool(first);
                     require(registry.lookup("ECHO") == first.get(), "case-insensitive lookup");
                     registry.register_tool(second);
                     require(registry.size() == 1, "same name replaces");
                     require(registry.lookup("echo") == second.get(), "latest wins");
                     require(registry.lookup("missing") == nullptr, "unknown is null");
                     registry.register_tool(nullptr);
                     require(registry.size() == 1, "null tool ignored");
                   }});

  tests.push_back({"tools_registry_suggests_close_names_only", [] {
                     tools::ToolRegistry registry;
                     registry.register_tool(std::make_shared<tools::ReadFileTool>());
                     registry.register_tool(std::make_shared<tools::WriteFileTool>());
                     require(registry.suggest("read_fil") == std::optional<std::string>("read_file"),
                             "typo should suggest");
                     require(registry.suggest("WRITE_FLIE") == std::optional<std::string>("write_file"),
                             "case-insensitive suggestion");
                     require(!registry.suggest("deploy_to_production").has_value(),
                             "unrelated name has no suggestion");
                     require(tools::edit_distance("kitten", "sitting") == 3, "edit distance");
                   }});

  tests.push_back({"tools_registry_subset_keeps_named_tools", [] {
                     tools::ToolRegistry registry;
                     registry.register_tool(std::make_shared<tools::ReadFileTool>());
                     registry.register_tool(std::make_shared<tools::WriteFileTool>());
                     registry.register_tool(std::make_shared<tools::CompleteTaskTool>());
                     const auto subset = registry.subset({"read_file", "nope", "complete_task"});
                     require(subset.size() == 2, "unknown names skipped");
                     require(subset.lookup("write_file") == nullptr, "excluded tool");
                     require(subset.lookup("read_file") == registry.lookup("read_file"),
                             "tools are shared, not copied");
                     const auto declarations = subset.list_declarations();
                     require(declarations.size() == 2 && declarations[0].name == "read_file",
                             "declarations follow registration order");
                   }});

  tests.push_back({"tools_builtins_register_expected_set", [] {
                     tools::ToolRegistry registry;
                     tools::register_builtin_tools(registry, testing::test_config());
                     for (const auto *name : {"run_shell_command", "read_file", "write_file",
                                              "complete_task"}) {
                       require(registry.lookup(name) != nullptr, std::string("missing ") + name);
                     }
                     const auto specs = registry.all_specs();
                     for (const auto &spec : specs) {
                       require(drover::common::json_kind(spec.parameters_json) ==
                                   drover::common::JsonKind::Object,
                               "schema must be an object: " + spec.name);
                     }
                     require(registry.lookup("read_file")->is_safe(), "read is safe");
                     require(!registry.lookup("run_shell_command")->is_safe(), "shell is not safe");
                   }});

  tests.push_back({"tools_schema_validation_reports_first_problem", [] {
                     const std::string schema =
                         R"({"type":"object","required":["path"],"additionalProperties":false,"properties":{"path":{"type":"string"},"limit":{"type":"integer"},"mode":{"type":"string","enum":["fast","slow"]}}})";
                     require(tools::validate_args(args_of(R"({"path":"a"})"), schema).ok(), "valid");
                     const auto missing = tools::validate_args(args_of("{}"), schema);
                     require(!missing.ok() && missing.error().find("'path'") != std::string::npos,
                             "missing required: " + missing.error());
                     require(!tools::validate_args(args_of(R"({"path":3})"), schema).ok(),
                             "wrong type");
                     require(!tools::validate_args(args_of(R"({"path":"a","limit":2.5})"), schema).ok(),
                             "integer rejects fractions");
                     require(!tools::validate_args(args_of(R"({"path":"a","mode":"medium"})"), schema)
                                  .ok(),
                             "enum rejects other values");
                     const auto extra = tools::validate_args(args_of(R"({"path":"a","x":1})"), schema);
                     require(!extra.ok() && extra.error().find("additional") != std::string::npos,
                             "closed schema rejects extras");
                     require(!tools::validate_args({}, "not json").ok(), "bad schema");
                   }});

  tests.push_back({"tools_resolve_in_workspace_blocks_escapes", [] {
                     testing::TempWorkspace workspace;
                     workspace.create_file("src/a.txt", "a");
                     const auto inside = tools::resolve_in_workspace(workspace.path(), "src/a.txt");
                     require(inside.ok(), inside.error());
                     require(!tools::resolve_in_workspace(workspace.path(), "../outside").ok(),
                             "parent escape");
                     require(!tools::resolve_in_workspace(workspace.path(), "/etc/passwd").ok(),
                             "absolute escape");
                     require(!tools::resolve_in_workspace(workspace.path(), "").ok(), "empty path");
                     require(tools::resolve_in_workspace(workspace.path(), "src/../new.txt").ok(),
                             "normalized path inside");
                   }});

  tests.push_back({"tools_read_file_pages_by_lines", [] {
                     testing::TempWorkspace workspace;
                     workspace.create_file("lines.txt", "one\ntwo\nthree\nfour\n");
                     tools::ReadFileTool tool;
                     const auto all = tool.execute(args_of(R"({"path":"lines.txt"})"),
                                                   context_for(workspace));
                     require(all.ok(), all.error());
                     require(all.value().output == "one\ntwo\nthree\nfour\n", "full read");
                     require(!all.value().truncated, "not truncated");
                     const auto page = tool.execute(
                         args_of(R"({"path":"lines.txt","offset":1,"limit":2})"),
                         context_for(workspace));
                     require(page.ok(), page.error());
                     require(page.value().output.rfind("two\nthree\n", 0) == 0, "paged content");
                     require(page.value().truncated, "more lines remain");
                     require(page.value().output.find("lines 2-3") != std::string::npos,
                             "paging hint");
                   }});

  tests.push_back({"tools_read_file_failures", [] {
                     testing::TempWorkspace workspace;
                     workspace.create_file("bin.dat", std::string("ab\0cd", 5));
                     tools::ReadFileTool tool;
                     require(!tool.execute(args_of(R"({"path":"absent.txt"})"), context_for(workspace))
                                  .ok(),
                             "missing file");
                     require(!tool.execute(args_of(R"({"path":"bin.dat"})"), context_for(workspace)).ok(),
                             "binary file");
                     require(!tool.execute({}, context_for(workspace)).ok(), "missing path arg");
                   }});

  tests.push_back({"tools_write_file_creates_and_overwrites", [] {
                     testing::TempWorkspace workspace;
                     tools::WriteFileTool tool;
                     const auto created = tool.execute(
                         args_of(R"({"path":"out.txt","content":"hello\n"})"), context_for(workspace));
                     require(created.ok(), created.error());
                     require(created.value().output.rfind("Created", 0) == 0, "created message");
                     const auto again = tool.execute(
                         args_of(R"({"path":"out.txt","content":"bye"})"), context_for(workspace));
                     require(again.ok() && again.value().output.rfind("Overwrote", 0) == 0,
                             "overwrite message");
                     const auto content = drover::common::read_text_file(workspace.path() / "out.txt");
                     require(content.ok() && content.value() == "bye", "file content");
                     require(!std::filesystem::exists(workspace.path() / "out.txt.drover-tmp"),
                             "temp file removed");
                     require(!tool.execute(args_of(R"({"path":"../x","content":""})"),
                                           context_for(workspace))
                                  .ok(),
                             "escape rejected");
                   }});

  tests.push_back({"tools_shell_runs_in_workspace_and_streams", [] {
                     testing::TempWorkspace workspace;
                     workspace.create_file("marker.txt", "x");
                     tools::ShellTool tool(5000);
                     std::string streamed;
                     auto ctx = context_for(workspace);
                     ctx.on_output = [&](std::string_view chunk) { streamed.append(chunk); };
                     const auto result =
                         tool.execute(args_of(R"({"command":"ls; echo err 1>&2"})"), ctx);
                     require(result.ok(), result.error());
                     require(result.value().success, "exit 0");
                     require(result.value().output.find("marker.txt") != std::string::npos,
                             "runs in workspace");
                     require(result.value().output.find("err") != std::string::npos,
                             "stderr captured");
                     require(streamed == result.value().output, "live output matches");
                     require(result.value().metadata.at("exit_code") == "0", "exit code metadata");
                   }});

  tests.push_back({"tools_shell_reports_nonzero_exit", [] {
                     testing::TempWorkspace workspace;
                     tools::ShellTool tool(5000);
                     const auto result =
                         tool.execute(args_of(R"({"command":"exit 3"})"), context_for(workspace));
                     require(result.ok(), result.error());
                     require(!result.value().success, "non-zero exit is failure");
                     require(result.value().metadata.at("exit_code") == "3", "exit code");
                   }});

  tests.push_back({"tools_shell_timeout_and_cancel_kill_process", [] {
                     testing::TempWorkspace workspace;
                     tools::ShellTool short_timeout(100);
                     const auto timed =
                         short_timeout.execute(args_of(R"({"command":"sleep 5"})"), context_for(workspace));
                     require(timed.ok() && !timed.value().success, "timeout fails the call");
                     require(timed.value().output.find("timed out") != std::string::npos,
                             "timeout note");

                     tools::ShellTool tool(10000);
                     drover::common::CancellationSource source;
                     auto ctx = context_for(workspace);
                     ctx.cancel = source.token();
                     std::thread canceller([&] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(50));
                       source.cancel();
                     });
                     const auto start = std::chrono::steady_clock::now();
                     const auto cancelled = tool.execute(args_of(R"({"command":"sleep 5"})"), ctx);
                     canceller.join();
                     require(std::chrono::steady_clock::now() - start < std::chrono::seconds(3),
                             "cancel should stop promptly");
                     require(cancelled.ok() && cancelled.value().metadata.contains("cancelled"),
                             "cancel metadata");
                   }});

  tests.push_back({"tools_shell_caps_captured_output", [] {
                     testing::TempWorkspace workspace;
                     tools::ShellTool tool(5000, 10);
                     const auto result = tool.execute(
                         args_of(R"({"command":"printf '0123456789abcdef'"})"), context_for(workspace));
                     require(result.ok(), result.error());
                     require(result.value().output == "0123456789", "output capped");
                     require(result.value().truncated, "truncated flag");
                   }});

  tests.push_back({"tools_complete_task_echoes_result", [] {
                     tools::CompleteTaskTool tool;
                     const auto done = tool.execute(args_of(R"({"result":"all good"})"), {});
                     require(done.ok() && done.value().output == "all good", "result echoed");
                     require(!tool.execute({}, {}).ok(), "missing result");
                   }});
}
