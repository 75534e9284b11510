// beaconpp discovery server demo: answers probes until Enter is pressed
#include "beaconpp/Logger.hpp"
#include "beaconpp/ServerHost.hpp"
#include "beaconpp/SocketException.hpp"
#include "beaconpp/SocketInitializer.hpp"
#include "beaconpp/UdpServer.hpp"
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace std;
using namespace beaconpp;

/**
 * @brief Parses a port argument; returns false if it is not a number in [0, 65535].
 */
bool parse_port(const string& text, Port& port)
{
    stringstream myStream(text);
    unsigned long value = 0;
    if (!(myStream >> value) || !myStream.eof() || value > 65535)
        return false;
    port = static_cast<Port>(value);
    return true;
}

int main(int argc, char* argv[])
{
    SocketInitializer sockInit;

    Port port = DefaultDiscoveryPort;
    if (argc > 1 && !parse_port(argv[1], port))
    {
        cerr << "Error: Invalid port number. Port must be between 0 and 65535." << endl;
        return 2;
    }
    const string url = argc > 2 ? argv[2] : "http://127.0.0.1:8096";
    const string id = argc > 3 ? argv[3] : "beaconpp-demo";
    const string name = argc > 4 ? argv[4] : "beaconpp demo server";

    auto logger = make_shared<ConsoleLogger>(LogLevel::Debug);
    auto host = make_shared<StaticServerHost>(url, id, name);

    try
    {
        UdpServer server(logger, host);
        server.start(port);
        cout << "Answering discovery probes on UDP port " << server.getLocalPort() << " as \"" << name << "\" ("
             << url << ")." << endl;
        cout << "Press Enter to stop." << endl;

        string line;
        getline(cin, line);

        server.stop();
    }
    catch (const SocketException& se)
    {
        cerr << "[FATAL] Error code: " << se.getErrorCode() << endl;
        cerr << "[FATAL] Error message: " << se.what() << endl;
        return 1;
    }

    for (const auto& alias : host->loopbackAliases())
        cout << "Loopback alias requested: " << alias << endl;

    cout << "Server stopped." << endl;
    return 0;
}
