#include "../include/statbench/sandbox.hpp"
#include "../include/statbench/log.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <random>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace statbench {

namespace {

constexpr const char* kComponent = "Sandbox";

std::string trim(const std::string& text) {
    auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    if (begin >= end) {
        return std::string();
    }
    return std::string(begin, end);
}

std::filesystem::path temp_directory() {
    std::error_code ec;
    auto dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return "/tmp";
    }
    return dir;
}

} // namespace

TempScript::TempScript(const std::string& contents) {
    std::string pattern = (temp_directory() / "statbench-XXXXXX.py").string();
    const int fd = ::mkstemps(pattern.data(), 3);
    if (fd < 0) {
        throw std::runtime_error(std::string("[sandbox] mkstemps failed: ") + std::strerror(errno));
    }
    ScopedFd file(fd);
    m_path = pattern;

    std::size_t offset = 0;
    while (offset < contents.size()) {
        const ssize_t written = ::write(file.get(), contents.data() + offset, contents.size() - offset);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            const std::string reason = std::strerror(errno);
            std::error_code ec;
            std::filesystem::remove(m_path, ec);
            throw std::runtime_error("[sandbox] writing script failed: " + reason);
        }
        offset += static_cast<std::size_t>(written);
    }
    // Readable by a container user other than the owner.
    ::fchmod(file.get(), 0644);
}

TempScript::~TempScript() {
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
}

std::string wrap_code(const std::string& code) {
    std::ostringstream script;
    script << "import sys\n"
              "import io\n"
              "from contextlib import redirect_stdout, redirect_stderr\n"
              "\n"
              "import numpy as np\n"
              "import scipy.stats as stats\n"
              "from scipy import stats as scipy_stats\n"
              "import pandas as pd\n"
              "import math\n"
              "from statsmodels.stats.power import TTestIndPower, NormalIndPower, tt_ind_solve_power\n"
              "from statsmodels.stats.proportion import proportion_effectsize, proportions_ztest\n"
              "\n"
              "_statbench_source = "
           << Json(code).dump()
           << "\n"
              "_statbench_stdout = io.StringIO()\n"
              "_statbench_stderr = io.StringIO()\n"
              "\n"
              "try:\n"
              "    with redirect_stdout(_statbench_stdout), redirect_stderr(_statbench_stderr):\n"
              "        exec(compile(_statbench_source, \"<snippet>\", \"exec\"), globals())\n"
              "    _statbench_output = _statbench_stdout.getvalue()\n"
              "    if _statbench_output:\n"
              "        print(_statbench_output)\n"
              "except Exception as e:\n"
              "    print(f\"Error: {type(e).__name__}: {e}\", file=sys.stderr)\n"
              "    sys.exit(1)\n";
    return script.str();
}

Json python_tool_parameters() {
    JsonObject code;
    code["type"] = Json("string");
    code["description"] = Json("Python code to execute. Print your results.");

    JsonObject properties;
    properties["code"] = Json(std::move(code));

    JsonObject parameters;
    parameters["type"] = Json("object");
    parameters["properties"] = Json(std::move(properties));
    parameters["required"] = Json(JsonArray{Json("code")});
    return Json(std::move(parameters));
}

Json python_tool_definition() {
    JsonObject function;
    function["name"] = Json("execute_python");
    function["description"] = Json(
        "Execute Python code for statistical calculations.\n\n"
        "Available libraries: numpy, scipy, statsmodels, pandas, math\n\n"
        "Use this tool to:\n"
        "- Calculate sample sizes and statistical power\n"
        "- Run statistical tests (t-tests, z-tests, chi-square)\n"
        "- Compute confidence intervals\n"
        "- Calculate effect sizes (Cohen's d, Cohen's h)\n"
        "- Perform numerical computations\n\n"
        "The code should print the final result.");
    function["parameters"] = python_tool_parameters();

    JsonObject tool;
    tool["type"] = Json("function");
    tool["function"] = Json(std::move(function));
    return Json(std::move(tool));
}

Sandbox::Sandbox(SandboxConfig config) : m_config(std::move(config)) {}

std::optional<ExecutionResult> Sandbox::validate_code(const std::string& code) const {
    if (trim(code).empty()) {
        return ExecutionResult::failure("No code provided");
    }
    const GovernorReport report = m_governor.inspect_code(code);
    if (!report.allowed) {
        return ExecutionResult::failure("Disallowed operation: " + report.blocked_pattern.value_or("unknown"));
    }
    return std::nullopt;
}

ExecutionResult Sandbox::execute(const Json& arguments) {
    std::string code;
    if (arguments.is_object()) {
        code = find_string(arguments.as_object(), "code").value_or("");
    }
    return execute(code);
}

ExecutionResult Sandbox::execute(const std::string& code) {
    if (auto rejection = validate_code(code)) {
        return *rejection;
    }
    try {
        TempScript script(wrap_code(code));
        return run_script(script.path());
    } catch (const std::exception& ex) {
        log_warning(kComponent, ex.what());
        return ExecutionResult::failure(std::string("Execution error: ") + ex.what());
    }
}

ExecutionResult Sandbox::timed_out_result() const {
    ExecutionResult result;
    result.timed_out = true;
    result.error = "Execution timed out after " + std::to_string(m_config.timeout_seconds) + "s";
    return result;
}

ExecutionResult Sandbox::from_process(const ProcessResult& process) {
    ExecutionResult result;
    result.success = process.exit_code == 0;
    result.output = trim(process.stdout_data);
    if (!result.success) {
        std::string error = trim(process.stderr_data);
        if (error.empty()) {
            error = "Process exited with code " + std::to_string(process.exit_code);
        }
        result.error = std::move(error);
    }
    return result;
}

LocalSandbox::LocalSandbox(SandboxConfig config) : Sandbox(std::move(config)) {}

ExecutionResult LocalSandbox::run_script(const std::filesystem::path& script) {
    ProcessRequest request;
    request.argv = {m_config.python_executable, script.string()};
    request.timeout = std::chrono::seconds(m_config.timeout_seconds);
    request.memory_limit_bytes = m_config.memory_limit_mb * 1024 * 1024;
    request.max_output_bytes = m_config.max_output_bytes;
    // BLAS thread pools reserve address space per thread and trip RLIMIT_AS.
    request.extra_env = {{"OPENBLAS_NUM_THREADS", "1"}, {"OMP_NUM_THREADS", "1"}, {"MKL_NUM_THREADS", "1"}};

    const ProcessResult process = run_process(request);
    if (process.timed_out) {
        return timed_out_result();
    }
    return from_process(process);
}

ContainerSandbox::ContainerSandbox(SandboxConfig config) : Sandbox(std::move(config)) {}

std::string ContainerSandbox::dockerfile(const std::string& base_image) {
    return "FROM " + base_image +
           "\n"
           "RUN pip install --no-cache-dir numpy scipy statsmodels pandas\n"
           "WORKDIR /app\n";
}

void ContainerSandbox::ensure_image() {
    std::scoped_lock lock(m_image_mutex);
    if (m_image_ready) {
        return;
    }

    ProcessRequest inspect;
    inspect.argv = {m_config.container_runtime, "image", "inspect", m_config.image};
    inspect.timeout = std::chrono::seconds(30);
    if (run_process(inspect).exit_code == 0) {
        m_image_ready = true;
        return;
    }

    log_info(kComponent, "building sandbox image " + m_config.image + " (first run only)");
    ProcessRequest build;
    build.argv = {m_config.container_runtime, "build", "-t", m_config.image, "-"};
    build.stdin_data = dockerfile(m_config.base_image);
    build.timeout = std::chrono::seconds(m_config.image_build_timeout_seconds);
    const ProcessResult built = run_process(build);
    if (built.timed_out) {
        throw std::runtime_error("[sandbox] image build timed out");
    }
    if (built.exit_code != 0) {
        throw std::runtime_error("[sandbox] image build failed: " + trim(built.stderr_data));
    }
    m_image_ready = true;
    log_info(kComponent, "sandbox image " + m_config.image + " ready");
}

std::string ContainerSandbox::container_name() const {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::ostringstream name;
    name << "statbench-" << std::hex << engine();
    return name.str();
}

void ContainerSandbox::kill_container(const std::string& name) const {
    ProcessRequest request;
    request.argv = {m_config.container_runtime, "kill", name};
    request.timeout = std::chrono::seconds(10);
    try {
        const ProcessResult killed = run_process(request);
        if (killed.exit_code != 0) {
            log_warning(kComponent, "could not kill container " + name + ": " + trim(killed.stderr_data));
        }
    } catch (const std::exception& ex) {
        log_warning(kComponent, "could not kill container " + name + ": " + ex.what());
    }
}

ExecutionResult ContainerSandbox::run_script(const std::filesystem::path& script) {
    ensure_image();

    const std::string name = container_name();
    const std::string memory = std::to_string(m_config.memory_limit_mb) + "m";

    ProcessRequest request;
    request.argv = {
        m_config.container_runtime,
        "run",
        "--rm",
        "--name", name,
        "--network", "none",
        "--memory", memory,
        "--memory-swap", memory,
        "-v", script.string() + ":/app/script.py:ro",
        m_config.image,
        "python", "/app/script.py",
    };
    request.timeout = std::chrono::seconds(m_config.timeout_seconds);
    request.max_output_bytes = m_config.max_output_bytes;

    const ProcessResult process = run_process(request);
    if (process.timed_out) {
        // Killing the CLI client leaves the container running.
        kill_container(name);
        return timed_out_result();
    }
    // 125..127 come from the runtime itself, not the script.
    if (process.exit_code >= 125 && process.exit_code <= 127) {
        return ExecutionResult::failure("Container error: " + trim(process.stderr_data));
    }
    return from_process(process);
}

bool container_runtime_available(const SandboxConfig& config) {
    ProcessRequest info_request;
    info_request.argv = {config.container_runtime, "info"};
    info_request.timeout = std::chrono::seconds(15);
    info_request.max_output_bytes = 64 * 1024;
    try {
        const ProcessResult result = run_process(info_request);
        return !result.timed_out && result.exit_code == 0;
    } catch (const std::exception& ex) {
        log_warning(kComponent, std::string("container runtime check failed: ") + ex.what());
        return false;
    }
}

std::unique_ptr<Sandbox> make_sandbox(const SandboxConfig& config) {
    switch (config.mode) {
    case SandboxMode::Local:
        log_info(kComponent, "using local execution");
        return std::make_unique<LocalSandbox>(config);
    case SandboxMode::Container:
        log_info(kComponent, "using " + config.container_runtime + " sandbox for code execution");
        return std::make_unique<ContainerSandbox>(config);
    case SandboxMode::Auto:
        break;
    }
    if (container_runtime_available(config)) {
        log_info(kComponent, "using " + config.container_runtime + " sandbox for code execution");
        return std::make_unique<ContainerSandbox>(config);
    }
    log_info(kComponent, config.container_runtime + " not available, using local execution");
    return std::make_unique<LocalSandbox>(config);
}

} // namespace statbench
