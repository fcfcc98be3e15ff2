#include "ground_station.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <cstdlib>
#include <iostream>

using namespace pacsat;

static void usage() {
  std::cerr
      << "usage: pacsat_station --callsign CALL[-SSID] [options]\n"
         "  --store DIR                    file store root\n"
         "  --transport kiss-serial|kiss-tcp|agwpe\n"
         "  --device PATH --baud N         serial KISS TNC\n"
         "  --xkiss --xkiss-checksum --kiss-port N\n"
         "  --tcp HOST:PORT                KISS-over-TCP or AGWPE server\n"
         "  --agwpe-port N                 AGWPE radio port\n"
         "  --dir-interval S --tick-ms MS --chunk-size N --on-demand-cap N\n"
         "  --transfer-timeout S --max-upload BYTES\n"
         "  --trash-retention DAYS --cleanup-interval S\n"
         "  --beacon-interval S --beacon-text TEXT\n"
         "  --rx-queue N --log-level trace|debug|info|warn|error\n";
}

int main(int argc, char **argv) {
  StationConfig cfg;
  std::string callsign;
  std::string transport = "kiss-tcp";
  std::string tcp = "127.0.0.1:8001";
  bool tcp_given = false;
  std::string level = "info";

  try {
    for (int i = 1; i < argc; i++) {
      std::string a = argv[i];
      auto next = [&](int &i) -> std::string {
        if (i + 1 < argc)
          return std::string(argv[++i]);
        std::cerr << "missing value for " << a << "\n";
        std::exit(1);
      };
      if (a == "--callsign")
        callsign = next(i);
      else if (a == "--store")
        cfg.store_root = next(i);
      else if (a == "--transport")
        transport = next(i);
      else if (a == "--device")
        cfg.link.device = next(i);
      else if (a == "--baud")
        cfg.link.baud = (unsigned)std::stoul(next(i));
      else if (a == "--xkiss")
        cfg.link.kiss.extended = true;
      else if (a == "--xkiss-checksum")
        cfg.link.kiss.checksum = true;
      else if (a == "--kiss-port")
        cfg.link.kiss.port = (uint8_t)std::stoi(next(i));
      else if (a == "--tcp") {
        tcp = next(i);
        tcp_given = true;
      } else if (a == "--agwpe-port")
        cfg.link.agwpe.port = (uint8_t)std::stoi(next(i));
      else if (a == "--dir-interval")
        cfg.broadcast.directory_interval = std::chrono::seconds(std::stoi(next(i)));
      else if (a == "--tick-ms")
        cfg.broadcast.tick = std::chrono::milliseconds(std::stoi(next(i)));
      else if (a == "--chunk-size")
        cfg.broadcast.chunk_size = cfg.ftl0.chunk_size = std::stoul(next(i));
      else if (a == "--on-demand-cap")
        cfg.broadcast.max_on_demand_per_cycle = std::stoul(next(i));
      else if (a == "--transfer-timeout")
        cfg.ftl0.transfer_timeout = std::chrono::seconds(std::stoi(next(i)));
      else if (a == "--max-upload")
        cfg.ftl0.max_upload = (uint32_t)std::stoul(next(i));
      else if (a == "--trash-retention")
        cfg.trash_retention = std::chrono::hours(24 * std::stoi(next(i)));
      else if (a == "--cleanup-interval")
        cfg.cleanup_interval = std::chrono::seconds(std::stoi(next(i)));
      else if (a == "--beacon-interval")
        cfg.beacon_interval = std::chrono::seconds(std::stoi(next(i)));
      else if (a == "--beacon-text")
        cfg.beacon_text = next(i);
      else if (a == "--rx-queue")
        cfg.link.rx_queue = std::stoul(next(i));
      else if (a == "--log-level")
        level = next(i);
      else if (a == "--help" || a == "-h") {
        usage();
        return 0;
      } else {
        std::cerr << "unknown option " << a << "\n";
        usage();
        return 1;
      }
    }
  } catch (const std::exception &e) {
    std::cerr << "bad numeric value: " << e.what() << "\n";
    return 1;
  }

  LogLevel lvl;
  if (!parse_log_level(level, lvl)) {
    std::cerr << "bad log level " << level << std::endl;
    return 1;
  }
  Logger::instance().set_level(lvl);

  if (!parse_address(callsign, cfg.callsign)) {
    std::cerr << "a valid --callsign is required" << std::endl;
    usage();
    return 1;
  }
  if (!parse_transport(transport, cfg.link.kind)) {
    std::cerr << "bad transport " << transport << std::endl;
    return 1;
  }
  if (cfg.link.kind == TransportKind::Agwpe && !tcp_given)
    tcp = "127.0.0.1:" + std::to_string(kAgwpeDefaultPort);
  if (!parse_host_port(tcp, cfg.link.host, cfg.link.port)) {
    std::cerr << "bad --tcp " << tcp << std::endl;
    return 1;
  }

  cfg.link.agwpe.callsign = cfg.callsign.to_string();
  cfg.broadcast.source = cfg.callsign;
  cfg.ftl0.callsign = cfg.callsign;
  cfg.ftl0.header_segment = cfg.broadcast.header_segment;
  cfg.pump_interval = cfg.broadcast.tick;

  asio::io_context io;
  GroundStation station(io, cfg);
  if (!station.start())
    return station.exit_code();
  io.run();
  return station.exit_code();
}
