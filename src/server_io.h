#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <string>
#include <scriptjail/policy.h>
#include <scriptjail/response.h>

extern std::string kListenHost;
extern int kListenPort;
extern int kMaxParallel;
extern size_t kMaxQueue;
// built once in main() before the server starts; read-only afterwards
extern SandboxPolicy kPolicy;

// Decode a POST /execute body, run the script and compose the reply.
// Does no admission control.
Response HandleExecute(const std::string& body, const SandboxPolicy&);

// Serve POST /execute on kListenHost:kListenPort.
// It only returns if the socket cannot be bound.
void ServerWorkLoop();

#endif  // SERVER_IO_H_
