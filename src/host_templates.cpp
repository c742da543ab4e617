#include "host_templates.h"
#include "utils.h"

std::string tmpl_injection_code(const std::string& engine_host, int engine_port,
                                const std::string& engine_path) {
    std::string code;
    code += "import sys\n";
    if (!engine_path.empty()) {
        code += "_dap_relay_engine_path = '" + escape_py_string(engine_path) + "'\n";
        code += "if _dap_relay_engine_path not in sys.path:\n";
        code += "    sys.path.insert(0, _dap_relay_engine_path)\n";
    }
    code += "import debugpy\n";
    code += "try:\n";
    code += "    debugpy.listen(('" + escape_py_string(engine_host) + "', " +
            std::to_string(engine_port) + "))\n";
    code += "except RuntimeError:\n";
    code += "    pass  # already listening from an earlier attach\n";
    return code;
}

std::string tmpl_run_directive(const std::string& program) {
    std::string dir = escape_py_string(path_dirname(program));
    std::string module = escape_py_string(path_module_name(program));

    std::string code;
    code += "import sys\n";
    code += "import importlib\n";
    code += "_dap_relay_dir = '" + dir + "'\n";
    code += "if _dap_relay_dir not in sys.path:\n";
    code += "    sys.path.insert(0, _dap_relay_dir)\n";
    code += "if '" + module + "' in sys.modules:\n";
    code += "    importlib.reload(sys.modules['" + module + "'])\n";
    code += "else:\n";
    code += "    importlib.import_module('" + module + "')\n";
    return code;
}

std::string tmpl_exec_command(const std::string& script_path) {
    std::string py = "exec(open('" + escape_py_string(script_path) + "').read())";
    return "python(\"" + escape_mel_string(py) + "\");";
}

std::string tmpl_remediation(const std::string& host, int port) {
    std::string addr = host + ":" + std::to_string(port);
    std::string text;
    text += "Could not connect to the host application's command port at " + addr + ".\n";
    text += "Please run the following command in Maya and try again:\n";
    text += "    cmds.commandPort(name=\"" + addr + "\", sourceType=\"mel\")\n";
    return text;
}
