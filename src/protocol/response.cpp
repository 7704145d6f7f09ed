#include "protocol/response.hpp"
#include <cerrno>
#include <system_error>
#include <vector>

namespace judgebox {
using namespace std;
using namespace nlohmann;

json ok_response(const json &payload) {
    return {{"Ok", payload}};
}

json err_response(const string &message) {
    return {{"Err", message}};
}

json invalid_program_response(const string &message) {
    return {{"InvalidProgram", message}};
}

void write_response(ostream &os, const json &response) {
    vector<uint8_t> data = json::to_cbor(response);
    os.write(reinterpret_cast<const char *>(data.data()), data.size());
    os.flush();
    if (!os)
        throw system_error(errno, system_category(), "unable to write response");
}

}  // namespace judgebox
