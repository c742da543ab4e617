#pragma once

#include <string>

// Source text executed inside the host application (Maya). The host runs
// Python snippets submitted through its MEL command port.

// Bootstraps the debug engine (debugpy) listening on engine_host:engine_port.
// engine_path, when not empty, is prepended to sys.path first.
std::string tmpl_injection_code(const std::string& engine_host, int engine_port,
                                const std::string& engine_path);

// Imports (or reloads) the user's program from its own directory.
std::string tmpl_run_directive(const std::string& program);

// MEL command that executes the Python file at script_path.
std::string tmpl_exec_command(const std::string& script_path);

// What the user has to do in the host to open its command port.
std::string tmpl_remediation(const std::string& host, int port);
