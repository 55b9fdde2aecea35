#ifndef INCLUDE_CODEEXEC_LOGGER_H_
#define INCLUDE_CODEEXEC_LOGGER_H_

// Keep the console sink usable in children forked while another thread logs.
void InitLogger();

#endif  // INCLUDE_CODEEXEC_LOGGER_H_
