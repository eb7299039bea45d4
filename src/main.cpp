/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 *
 * vasr - command line front end
 *
 * Reads Opus packets from a file ([2-byte little-endian length][packet]...),
 * runs one recognition and prints the text on stdout.
 */

#include <errno.h>
#include <getopt.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "asr/asr_session.h"
#include "config/config_env.h"
#include "config/config_parser.h"
#include "config/config_validate.h"
#include "logging.h"
#include "vasr.h"

namespace {

#define MAX_CONFIG_ERRORS 32
#define ABORT_POLL_MS 50

volatile sig_atomic_t g_quit = 0;

void signal_handler(int signum) {
   (void)signum;
   g_quit = 1;
}

void print_usage(const char *prog) {
   printf("Usage: %s [options] <packet-file>\n\n", prog);
   printf("Streams Opus packets to the speech recognition service and prints the text.\n\n");
   printf("Options:\n");
   printf("  -c, --config PATH      Configuration file (default: search %s, %s, %s)\n",
          CONFIG_PATH_LOCAL, CONFIG_PATH_HOME, CONFIG_PATH_ETC);
   printf("  -s, --secrets PATH     Secrets file with the [volcengine] section\n");
   printf("  -o, --output-dir DIR   Save the uploaded WAV audio into DIR\n");
   printf("  -l, --language LANG    Recognition language (default: %s)\n", VASR_DEFAULT_LANGUAGE);
   printf("      --dump-config      Print the effective configuration and exit\n");
   printf("  -v, --verbose          Debug logging\n");
   printf("  -h, --help             Show this help\n\n");
   printf("Packet file format: [2-byte little-endian length][packet] repeated.\n");
}

/* Loads the whole packet file; packets point into data */
bool read_packet_file(const char *path,
                      std::vector<uint8_t> &data,
                      std::vector<vasr_packet_t> &packets) {
   FILE *fp = fopen(path, "rb");
   if (!fp) {
      VASR_LOG_ERROR("Cannot open %s: %s", path, strerror(errno));
      return false;
   }

   uint8_t block[4096];
   size_t n;
   while ((n = fread(block, 1, sizeof(block), fp)) > 0)
      data.insert(data.end(), block, block + n);
   bool read_error = ferror(fp) != 0;
   fclose(fp);
   if (read_error) {
      VASR_LOG_ERROR("Error reading %s", path);
      return false;
   }

   size_t offset = 0;
   while (offset < data.size()) {
      if (data.size() - offset < 2) {
         VASR_LOG_ERROR("%s: truncated length prefix at offset %zu", path, offset);
         return false;
      }
      size_t len = (size_t)data[offset] | ((size_t)data[offset + 1] << 8);
      offset += 2;
      if (len > data.size() - offset) {
         VASR_LOG_ERROR("%s: packet at offset %zu claims %zu bytes, %zu left", path, offset - 2,
                        len, data.size() - offset);
         return false;
      }
      if (len > VASR_OPUS_MAX_PACKET_SIZE)
         VASR_LOG_WARNING("%s: packet at offset %zu is %zu bytes", path, offset - 2, len);
      packets.push_back({ data.data() + offset, len });
      offset += len;
   }
   return true;
}

}  // namespace

int main(int argc, char *argv[]) {
   const char *config_path = NULL;
   const char *secrets_path = NULL;
   const char *output_dir = NULL;
   const char *language = NULL;
   bool dump_config = false;
   bool verbose = false;

   enum { OPT_DUMP_CONFIG = 256 };
   static const struct option long_options[] = {
      { "config", required_argument, NULL, 'c' },
      { "secrets", required_argument, NULL, 's' },
      { "output-dir", required_argument, NULL, 'o' },
      { "language", required_argument, NULL, 'l' },
      { "dump-config", no_argument, NULL, OPT_DUMP_CONFIG },
      { "verbose", no_argument, NULL, 'v' },
      { "help", no_argument, NULL, 'h' },
      { NULL, 0, NULL, 0 },
   };

   int opt;
   while ((opt = getopt_long(argc, argv, "c:s:o:l:vh", long_options, NULL)) != -1) {
      switch (opt) {
         case 'c':
            config_path = optarg;
            break;
         case 's':
            secrets_path = optarg;
            break;
         case 'o':
            output_dir = optarg;
            break;
         case 'l':
            language = optarg;
            break;
         case OPT_DUMP_CONFIG:
            dump_config = true;
            break;
         case 'v':
            verbose = true;
            break;
         case 'h':
            print_usage(argv[0]);
            return 0;
         default:
            print_usage(argv[0]);
            return 1;
      }
   }

   /* Console logging until the configured sink is known */
   vasr_logging_init(NULL, verbose ? VASR_LOG_DEBUG : VASR_LOG_WARNING);

   /* Defaults < config file < secrets file < environment < command line */
   vasr_config_t config;
   vasr_config_init_defaults(&config);
   if (config_load_from_search(config_path, &config) != 0)
      return 1;
   if (config_load_secrets_from_search(secrets_path, &config.secrets) != 0)
      return 1;
   config_apply_env(&config);

   if (language)
      safe_strncpy(config.audio.language, language, sizeof(config.audio.language));
   if (output_dir) {
      safe_strncpy(config.output.dir, output_dir, sizeof(config.output.dir));
      config.output.save_audio = true;
   }

   if (dump_config) {
      config_dump(&config, stdout);
      return 0;
   }

   config_error_t errors[MAX_CONFIG_ERRORS];
   int error_count = config_validate(&config, errors, MAX_CONFIG_ERRORS);
   if (error_count > 0) {
      fprintf(stderr, "%s: %d problem(s)\n", vasr_error_string(VASR_ERR_CONFIG), error_count);
      config_print_errors(errors, error_count < MAX_CONFIG_ERRORS ? error_count : MAX_CONFIG_ERRORS);
      return 1;
   }

   vasr_log_level_t level;
   if (vasr_log_level_from_string(config.general.log_level, &level) != 0)
      level = VASR_LOG_INFO;
   if (verbose)
      level = VASR_LOG_DEBUG;
   if (vasr_logging_init(config.general.log_file, level) != 0)
      fprintf(stderr, "Warning: could not open %s, logging to stderr\n", config.general.log_file);

   if (optind != argc - 1) {
      print_usage(argv[0]);
      vasr_logging_close();
      return 1;
   }

   std::vector<uint8_t> file_data;
   std::vector<vasr_packet_t> packets;
   if (!read_packet_file(argv[optind], file_data, packets)) {
      vasr_logging_close();
      return 1;
   }
   VASR_LOG_INFO("Read %zu packets from %s", packets.size(), argv[optind]);

   vasr_session_t *session = vasr_session_create(&config, NULL, NULL);
   if (!session) {
      vasr_logging_close();
      return 1;
   }

   struct sigaction sa;
   memset(&sa, 0, sizeof(sa));
   sa.sa_handler = signal_handler;
   sigemptyset(&sa.sa_mask);
   sigaction(SIGINT, &sa, NULL);
   sigaction(SIGTERM, &sa, NULL);

   /* Recognition runs on a worker so this thread can forward Ctrl+C */
   vasr_result_t result;
   std::atomic<bool> finished{ false };
   std::thread worker([&]() {
      vasr_session_recognize(session, packets.data(), packets.size(), &result);
      finished.store(true);
   });

   bool aborted = false;
   while (!finished.load()) {
      if (g_quit && !aborted) {
         vasr_session_abort(session);
         aborted = true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(ABORT_POLL_MS));
   }
   worker.join();

   int exit_code = 0;
   if (result.error == VASR_SUCCESS) {
      if (result.text)
         printf("%s\n", result.text);
      if (result.audio_path[0] != '\0')
         VASR_LOG_INFO("Audio saved to %s", result.audio_path);
   } else {
      fprintf(stderr, "Recognition failed (%s) in state %s: %s\n", vasr_error_string(result.error),
              vasr_session_state_name(result.failed_state), result.message);
      if (result.has_remote_code)
         fprintf(stderr, "Service status code: %lld\n", (long long)result.remote_code);
      exit_code = 1;
   }

   vasr_result_clear(&result);
   vasr_session_destroy(session);
   vasr_logging_close();
   return exit_code;
}
