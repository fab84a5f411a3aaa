#ifndef MINIFIN_CEF_TEST_ENV_H
#define MINIFIN_CEF_TEST_ENV_H

// True once cef_test_main has brought up a browser process. Tests that
// need libcef skip themselves otherwise.
bool cef_test_initialized();

#endif // MINIFIN_CEF_TEST_ENV_H
