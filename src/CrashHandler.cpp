#include "CrashHandler.hpp"

#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <spdlog/spdlog.h>

#if defined(_WIN32)
// clang-format off
#include <windows.h>
#include <dbghelp.h>
// clang-format on
#pragma comment(lib, "dbghelp.lib")
#else
#include <cxxabi.h>
#include <dlfcn.h>
#include <execinfo.h>
#include <sys/utsname.h>
#endif

namespace {
CrashHandler::Config g_config;

std::string timestamp() {
  auto t = std::time(nullptr);
  auto tm = *std::localtime(&t);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

void writeReport(const std::string &header) {
  const std::string report = CrashHandler::formatReport(header);
  FILE *f = std::fopen(g_config.crashLogPath.c_str(), "w");
  if (f) {
    std::fwrite(report.c_str(), 1, report.size(), f);
    std::fclose(f);
  }

  if (auto logger = spdlog::default_logger())
    logger->flush();
}

#if defined(_WIN32)
LONG WINAPI exceptionHandler(PEXCEPTION_POINTERS pExceptionInfo) {
  std::stringstream ss;
  ss << "Exception Code: 0x" << std::hex
     << pExceptionInfo->ExceptionRecord->ExceptionCode << std::dec << "\n";
  writeReport(ss.str());
  return EXCEPTION_EXECUTE_HANDLER;
}
#else
void signalHandler(int sig) {
  std::stringstream ss;
  ss << "Signal: " << sig << " (" << strsignal(sig) << ")\n";
  writeReport(ss.str());
  std::_Exit(1);
}
#endif
} // namespace

namespace CrashHandler {

void init(const Config &config) {
  g_config = config;
#if defined(_WIN32)
  SetUnhandledExceptionFilter(exceptionHandler);
#else
  for (int sig : {SIGSEGV, SIGABRT, SIGFPE, SIGILL, SIGBUS}) {
    std::signal(sig, signalHandler);
  }
#endif
  spdlog::debug("Crash handler installed, report path: {}",
                g_config.crashLogPath);
}

std::string formatReport(const std::string &header) {
  std::stringstream ss;
  ss << header;
  ss << "Time: " << timestamp() << "\n\n";
  ss << getPlatformInfo() << "\n";
  if (g_config.enableStackTrace)
    ss << getStackTrace();
  return ss.str();
}

std::string getPlatformInfo() {
  std::stringstream ss;
#if defined(_WIN32)
  SYSTEM_INFO sysInfo;
  GetNativeSystemInfo(&sysInfo);
  ss << "Processor Architecture: ";
  switch (sysInfo.wProcessorArchitecture) {
  case PROCESSOR_ARCHITECTURE_AMD64:
    ss << "x64";
    break;
  case PROCESSOR_ARCHITECTURE_ARM:
    ss << "ARM";
    break;
  case PROCESSOR_ARCHITECTURE_INTEL:
    ss << "x86";
    break;
  default:
    ss << "Unknown";
  }
  ss << "\nNumber of Processors: " << sysInfo.dwNumberOfProcessors << "\n";
#else
  struct utsname uts;
  if (uname(&uts) == 0) {
    ss << "System: " << uts.sysname << "\n"
       << "Release: " << uts.release << "\n"
       << "Version: " << uts.version << "\n"
       << "Machine: " << uts.machine << "\n";
  }
#endif
  return ss.str();
}

std::string getStackTrace(size_t maxFrames) {
  std::stringstream ss;
  maxFrames = std::min(maxFrames, static_cast<size_t>(256));

#if defined(_WIN32)
  HANDLE process = GetCurrentProcess();
  SymInitialize(process, NULL, TRUE);

  void *stack[256];
  WORD frames =
      CaptureStackBackTrace(0, static_cast<DWORD>(maxFrames), stack, NULL);

  SYMBOL_INFO *symbol =
      (SYMBOL_INFO *)calloc(sizeof(SYMBOL_INFO) + 256 * sizeof(char), 1);
  symbol->MaxNameLen = 255;
  symbol->SizeOfStruct = sizeof(SYMBOL_INFO);

  for (WORD i = 0; i < frames; i++) {
    SymFromAddr(process, (DWORD64)stack[i], 0, symbol);
    ss << i << ": " << symbol->Name << " [0x" << std::hex << symbol->Address
       << std::dec << "]\n";
  }

  free(symbol);
  SymCleanup(process);
#else
  void *array[256];
  int size = backtrace(array, static_cast<int>(maxFrames));
  char **messages = backtrace_symbols(array, size);

  for (int i = 0; i < size && messages != NULL; i++) {
    Dl_info info;
    if (dladdr(array[i], &info) && info.dli_sname) {
      int status;
      char *demangled =
          abi::__cxa_demangle(info.dli_sname, NULL, NULL, &status);
      ss << i << ": " << (demangled ? demangled : info.dli_sname);
      free(demangled);
      if (info.dli_fname)
        ss << " in " << info.dli_fname;
      ss << " at " << array[i] << "\n";
    } else {
      ss << i << ": " << messages[i] << "\n";
    }
  }
  free(messages);
#endif

  return ss.str();
}

} // namespace CrashHandler
