#ifndef INCLUDE_SCRIPTJAIL_LOGGER_H_
#define INCLUDE_SCRIPTJAIL_LOGGER_H_

// Make the default spdlog logger safe to use across fork()
void InitLogger();

#endif  // INCLUDE_SCRIPTJAIL_LOGGER_H_
