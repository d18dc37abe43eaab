#include "Discovery/AutoDiscoveryService.h"
#include "Logging/LogManager.h"
#include "Utils/ConfigManager.h"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace HomeLens::Discovery;

namespace {

std::vector<std::string> SplitList(const std::string &text) {
  std::vector<std::string> items;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty())
      items.push_back(item);
  }
  return items;
}

void PrintUsage(const char *program) {
  std::cout << "Usage: " << program << " [options]\n"
            << "  --protocols=a,b       탐색할 프로토콜 (기본: DISCOVERY_PROTOCOLS)\n"
            << "  --integration=<id>    특정 통합 패턴만 탐색 (hue, sonos ...)\n"
            << "  --sequential          어댑터를 순차 실행\n"
            << "  --timeout=<sec>       전역 탐색 데드라인\n"
            << "  --config=<dir>        설정 디렉토리\n"
            << "  --capture=<file>      캡처 파일 재생 어댑터 사용\n"
            << "  --stats               탐색 후 캐시 통계 출력\n";
}

} // namespace

int main(int argc, char *argv[]) {
  try {
    std::string config_dir;
    std::string integration_id;
    std::string protocols_arg;
    std::string timeout_arg;
    std::string capture_file;
    bool sequential = false;
    bool print_stats = false;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg.find("--protocols=") == 0) {
        protocols_arg = arg.substr(12);
      } else if (arg.find("--integration=") == 0) {
        integration_id = arg.substr(14);
      } else if (arg == "--sequential") {
        sequential = true;
      } else if (arg.find("--timeout=") == 0) {
        timeout_arg = arg.substr(10);
      } else if (arg.find("--config=") == 0) {
        config_dir = arg.substr(9);
      } else if (arg.find("--capture=") == 0) {
        capture_file = arg.substr(10);
      } else if (arg == "--stats") {
        print_stats = true;
      } else if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else {
        std::cerr << "❌ Error: unknown option " << arg << std::endl;
        PrintUsage(argv[0]);
        return -1;
      }
    }

    // 설정 디렉토리는 ConfigManager 첫 사용 전에 지정해야 한다
    if (!config_dir.empty()) {
      setenv("HOMELENS_CONFIG_DIR", config_dir.c_str(), 1);
    }
    auto &config = ConfigManager::getInstance();
    ReloadLogSettings();

    // 명령행 옵션이 설정 파일보다 우선
    if (!timeout_arg.empty())
      config.set("DISCOVERY_TIMEOUT_SEC", timeout_arg);
    if (sequential)
      config.set("DISCOVERY_PARALLEL", "false");
    if (!capture_file.empty())
      config.set("DISCOVERY_CAPTURE_FILE", capture_file);

    auto service = AutoDiscoveryService::CreateFromConfig();
    if (service->GetAdapterRegistry().GetAdapterCount() == 0) {
      LogManager::getInstance().Warn(
          "No discovery adapters registered (set DISCOVERY_CAPTURE_FILE or --capture)");
    }

    if (!integration_id.empty()) {
      auto devices = service->DiscoverForIntegration(integration_id);
      nlohmann::json output = nlohmann::json::array();
      for (const auto &device : devices) {
        output.push_back(device.toJson());
      }
      std::cout << output.dump(2) << std::endl;
    } else {
      auto results = service->DiscoverAllProtocols(SplitList(protocols_arg));
      std::cout << results.toJson().dump(2) << std::endl;
    }

    if (print_stats) {
      std::cout << service->GetDiscoveryStatistics().toJson().dump(2)
                << std::endl;
    }

    LogManager::getInstance().flushAll();
    return 0;

  } catch (const std::exception &e) {
    std::cerr << "💥 오류: " << e.what() << std::endl;
    return -1;
  }
}
