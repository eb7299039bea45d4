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
 * VASR Configuration System - configuration struct definitions
 *
 * Thread Safety: Configuration is loaded once at startup and copied into each
 * session. Sessions never modify it.
 */

#ifndef VASR_CONFIG_H
#define VASR_CONFIG_H

#include <stdbool.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

/* =============================================================================
 * Buffer Size Constants
 * ============================================================================= */
#define CONFIG_PATH_MAX 256
#define CONFIG_NAME_MAX 64
#define CONFIG_HOST_MAX 256
#define CONFIG_CREDENTIAL_MAX 128

/* Default config file locations (searched in order) */
#define CONFIG_PATH_LOCAL "./vasr.toml"
#define CONFIG_PATH_HOME "~/.config/vasr/vasr.toml"
#define CONFIG_PATH_ETC "/etc/vasr/vasr.toml"

#define SECRETS_PATH_LOCAL "./secrets.toml"
#define SECRETS_PATH_HOME "~/.config/vasr/secrets.toml"
#define SECRETS_PATH_ETC "/etc/vasr/secrets.toml"

/* =============================================================================
 * Default Values
 * ============================================================================= */
#define VASR_DEFAULT_HOST "openspeech.bytedance.com"
#define VASR_DEFAULT_PATH "/api/v2/asr"
#define VASR_DEFAULT_PORT 443
#define VASR_DEFAULT_SUCCESS_CODE 1000
#define VASR_DEFAULT_CONNECT_TIMEOUT_MS 5000
#define VASR_DEFAULT_RECEIVE_TIMEOUT_MS 10000
#define VASR_DEFAULT_LANGUAGE "zh-CN"
#define VASR_DEFAULT_SEGMENT_DURATION_MS 15000

/* =============================================================================
 * General Configuration
 * ============================================================================= */
typedef struct {
   char log_file[CONFIG_PATH_MAX]; /* Empty = stderr, or path */
   char log_level[16];             /* "debug", "info", "warning", "error" */
} general_config_t;

/* =============================================================================
 * Service Configuration
 * ============================================================================= */
typedef struct {
   char host[CONFIG_HOST_MAX];
   char path[CONFIG_PATH_MAX];
   int port;
   bool ssl;
   bool ssl_verify;                    /* false accepts self-signed certificates */
   char ca_cert_path[CONFIG_PATH_MAX]; /* Empty = system trust store */
   char cluster[CONFIG_NAME_MAX];      /* Service cluster, e.g. "volcengine_input_common" */
   int success_code;                   /* Status code that means success */
   int connect_timeout_ms;
   int receive_timeout_ms;             /* Deadline for each server frame */
} service_config_t;

/* =============================================================================
 * Audio Configuration
 * ============================================================================= */
typedef struct {
   char language[CONFIG_NAME_MAX]; /* Recognition language, e.g. "zh-CN" */
   int segment_duration_ms;        /* Audio per AudioOnlyRequest frame */
} audio_config_t;

/* =============================================================================
 * Output Configuration
 * ============================================================================= */
typedef struct {
   char dir[CONFIG_PATH_MAX]; /* Where prepared WAV files are written */
   bool save_audio;           /* Keep a copy of every uploaded container */
} output_config_t;

/* =============================================================================
 * Secrets Configuration (loaded separately from secrets.toml)
 * ============================================================================= */
typedef struct {
   char appid[CONFIG_CREDENTIAL_MAX];
   char access_token[CONFIG_CREDENTIAL_MAX];
} secrets_config_t;

/* =============================================================================
 * Main Configuration Structure
 * ============================================================================= */
typedef struct {
   general_config_t general;
   service_config_t service;
   audio_config_t audio;
   output_config_t output;
   secrets_config_t secrets;
} vasr_config_t;

/* =============================================================================
 * Configuration API
 * ============================================================================= */

/**
 * @brief Initialize config with default values
 *
 * Sets all fields to their compile-time defaults. Call this before parsing
 * any config files to ensure all values have sensible defaults.
 *
 * @param config Config struct to initialize
 */
void vasr_config_init_defaults(vasr_config_t *config);

/**
 * @brief Initialize secrets with empty values
 *
 * @param secrets Secrets struct to initialize
 */
void config_set_secrets_defaults(secrets_config_t *secrets);

#ifdef __cplusplus
}
#endif

#endif /* VASR_CONFIG_H */
