#ifndef CONFIG_UTILS_H
#define CONFIG_UTILS_H

#include <stddef.h>

/* Build a config file path inside XDG_CONFIG_HOME/minifin or ~/.config/minifin */
void config_build_path(char *buf, size_t len, const char *filename);

/* Same for application data: XDG_DATA_HOME/minifin or ~/.local/share/minifin */
void config_build_data_path(char *buf, size_t len, const char *filename);

/* Create the minifin config directory (and its parents). Returns 0 on
 * success, -1 with errno set otherwise.
 */
int config_ensure_dir(void);
int config_ensure_data_dir(void);

/* Read a string value from a simple "key value" config file.
 * Returns 1 when the key was found, 0 when file or key is missing and
 * -1 when the file exists but cannot be read.
 */
int config_read_string(const char *filename, const char *key, char *out, size_t out_len);

/* Read an integer value. Returns default_value if file/key is missing or
 * the stored value is not a number.
 */
int config_read_int(const char *filename, const char *key, int default_value);

/* Write a single key/value pair to the config file, keeping every other
 * line. The file is replaced atomically and synced before returning.
 * Returns 0 on success, -1 with errno set otherwise.
 */
int config_write_string(const char *filename, const char *key, const char *value);

#endif /* CONFIG_UTILS_H */
