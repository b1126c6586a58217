/*
 * Copyright (c) 2014, Airbitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Command.hpp"
#include <iostream>
#include <getopt.h>
#include <stdlib.h>
#include <unistd.h>

using namespace xpcd;

/**
 * The main program body.
 */
static Status run(int argc, char *argv[])
{
    // A missing settings file just means defaults:
    ConfigJson json;
    const auto path = configPath();
    if (0 == access(path.c_str(), F_OK))
        XPC_CHECK(json.load(path));

    // Parse out the command-line options:
    std::string endpoint;
    bool legacy = false;
    bool wantHelp = false;

    static const struct option long_options[] =
    {
        {"endpoint",    required_argument, nullptr, 'e'},
        {"legacy",      no_argument,       nullptr, 'l'},
        {"timeout",     required_argument, nullptr, 't'},
        {"help",        no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };
    opterr = 0;
    int c;
    while (-1 != (c = getopt_long(argc, argv, "e:hlt:", long_options, nullptr)))
    {
        switch (c)
        {
        case 'e':
            endpoint = optarg;
            break;
        case 'h':
            wantHelp = true;
            break;
        case 'l':
            legacy = true;
            break;
        case 't':
            XPC_CHECK(json.timeoutSet(atol(optarg)));
            break;
        case '?':
            if (optopt == 'e')
                return XPC_ERROR(XPC_CC_Error, "-e requires an endpoint");
            else if (optopt == 't')
                return XPC_ERROR(XPC_CC_Error, "-t requires a timeout in seconds");
            else
                return XPC_ERROR(XPC_CC_Error, "Unknown option '" +
                                 std::string(argv[optind - 1]) + "'");
        default:
            return XPC_ERROR(XPC_CC_Error, "Option parsing failed");
        }
    }

    // Command-line choices beat the settings file:
    if (legacy)
        XPC_CHECK(json.backendSet("legacy"));
    if (!endpoint.empty())
    {
        if (std::string("legacy") == json.backend())
            XPC_CHECK(json.legacyEndpointSet(endpoint.c_str()));
        else
            XPC_CHECK(json.endpointSet(endpoint.c_str()));
    }

    // At this point, all non-option arguments should be out of the list:
    argc -= optind;
    argv += optind;

    // Find the command:
    if (argc < 1)
    {
        CommandRegistry::print();
        return Status();
    }
    const auto commandName = argv[0];
    --argc;
    ++argv;

    Command *command = CommandRegistry::find(commandName);
    if (!command)
        return XPC_ERROR(XPC_CC_Error,
                         "unknown command " + std::string(commandName));

    // If the user wants help, just print the string and return:
    if (wantHelp)
    {
        std::cout << helpString(*command) << std::endl;
        return Status();
    }

    // Populate the session up to the required level:
    Session session;
    if (InitLevel::context <= command->level())
    {
        XPC_CHECK(Context::create(session.context, json));
    }
    if (InitLevel::network <= command->level())
    {
        session.network = session.context->networkClient();
    }

    // Invoke the command:
    XPC_CHECK((*command)(session, argc, argv));

    return Status();
}

int main(int argc, char *argv[])
{
    Status s = run(argc, argv);
    if (!s)
        std::cerr << s << std::endl;
    return s ? 0 : 1;
}
