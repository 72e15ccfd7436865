#include <cassert>
#include <iostream>

#include "domain/AgentCommand.hpp"
#include "domain/OutputPatterns.hpp"
#include "domain/Profile.hpp"
#include "test/TestSupport.hpp"

using agentdeck::domain::OutputPatterns;
using agentdeck::domain::RateLimitKind;
namespace domain = agentdeck::domain;

int main() {
    std::cout << "[Test] Starting OutputPatterns Test..." << std::endl;

    // ANSI stripping
    {
        assert(OutputPatterns::StripAnsi("\x1b[1;32mgreen\x1b[0m text") == "green text");
        assert(OutputPatterns::StripAnsi("\x1b[?25lhidden cursor") == "hidden cursor");
        assert(OutputPatterns::StripAnsi("plain") == "plain");
        std::cout << "[PASS] StripAnsi" << std::endl;
    }

    // Tokens survive colouring and terminal line wrapping.
    {
        const std::string token = agentdeck::test::SampleToken('x');
        assert(OutputPatterns::ExtractToken("Your token: " + token + "\r\n") == token);

        const std::string wrapped = "Token:\r\n\x1b[33m" + token.substr(0, 40) + "\r\n" + token.substr(40) + "\x1b[0m";
        assert(OutputPatterns::ExtractToken(wrapped) == token);

        // Too short to be a token.
        assert(!OutputPatterns::ExtractToken("sk-ant-oat01-abc").has_value());
        assert(!OutputPatterns::ExtractToken("nothing here").has_value());
        std::cout << "[PASS] ExtractToken" << std::endl;
    }

    {
        assert(OutputPatterns::ExtractEmail("Logged in as dev@example.com\r\n") ==
               std::optional<std::string>("dev@example.com"));
        assert(OutputPatterns::ExtractEmail("\x1b[1mAuthenticated as\x1b[0m ops.team+ci@corp.example.org") ==
               std::optional<std::string>("ops.team+ci@corp.example.org"));
        assert(OutputPatterns::ExtractEmail("Email: a.b@c.io") == std::optional<std::string>("a.b@c.io"));
        assert(!OutputPatterns::ExtractEmail("contact us at help").has_value());
        std::cout << "[PASS] ExtractEmail" << std::endl;
    }

    // Rate limits: both separators, reset text up to the end of the line.
    {
        const std::string middleDot = std::string("5-hour limit reached\r\nLimit reached \xC2\xB7") + " resets 3pm (Europe/Oslo)\r\n/upgrade";
        assert(OutputPatterns::ExtractRateLimitReset(middleDot) == std::optional<std::string>("3pm (Europe/Oslo)"));

        const std::string bullet = std::string("\x1b[31mLimit reached \xE2\x80\xA2") + " resets Dec 17 at 6am (UTC)\x1b[0m\n";
        assert(OutputPatterns::ExtractRateLimitReset(bullet) == std::optional<std::string>("Dec 17 at 6am (UTC)"));

        assert(!OutputPatterns::ExtractRateLimitReset("Limit reached").has_value());
        assert(!OutputPatterns::ExtractRateLimitReset("All good").has_value());
        std::cout << "[PASS] ExtractRateLimitReset" << std::endl;
    }

    {
        assert(OutputPatterns::ClassifyLimit("3pm (Europe/Oslo)") == RateLimitKind::Session);
        assert(OutputPatterns::ClassifyLimit("at 11:30pm") == RateLimitKind::Session);
        assert(OutputPatterns::ClassifyLimit("Dec 17 at 6am (Europe/Oslo)") == RateLimitKind::Weekly);
        assert(OutputPatterns::ClassifyLimit("next week") == RateLimitKind::Weekly);
        std::cout << "[PASS] ClassifyLimit" << std::endl;
    }

    {
        auto failure = OutputPatterns::ExtractAuthFailure("Opening browser...\r\nError: OAuth token has expired. Please retry.\r\n> ");
        assert(failure == std::optional<std::string>("Error: OAuth token has expired. Please retry."));
        assert(OutputPatterns::ExtractAuthFailure("Login failed").has_value());
        assert(OutputPatterns::ExtractAuthFailure("401 Unauthorized").has_value());
        assert(!OutputPatterns::ExtractAuthFailure("Login successful").has_value());
        std::cout << "[PASS] ExtractAuthFailure" << std::endl;
    }

    {
        assert(OutputPatterns::HasReadyBanner("\x1b[1m* Welcome to Claude Code!\x1b[0m"));
        assert(OutputPatterns::HasReadyBanner("  ? for shortcuts"));
        assert(!OutputPatterns::HasReadyBanner("Select a theme"));
        std::cout << "[PASS] HasReadyBanner" << std::endl;
    }

    // Profile ids
    {
        assert(domain::MakeProfileId("Work Account") == "work-account");
        assert(domain::MakeProfileId("  Team__Alpha  2 ") == "team-alpha-2");
        assert(domain::MakeProfileId("***").empty());
        std::cout << "[PASS] MakeProfileId" << std::endl;
    }

    // Relaunch command lines
    {
        assert(domain::ShellQuote("it's") == "'it'\\''s'");

        domain::RelaunchSpec viaFile;
        viaFile.tokenEnvFile = "/tmp/agentdeck-token-abc123";
        const std::string fileLine = domain::BuildRelaunchCommand(viaFile);
        assert(fileLine.find("source '/tmp/agentdeck-token-abc123'") != std::string::npos);
        assert(fileLine.find("rm -f '/tmp/agentdeck-token-abc123'") != std::string::npos);
        assert(fileLine.find("exec claude") != std::string::npos);
        assert(fileLine.back() == '\r');

        domain::RelaunchSpec viaDir;
        viaDir.credentialDirectory = "/home/u/.agentdeck/work";
        const std::string dirLine = domain::BuildRelaunchCommand(viaDir);
        assert(dirLine.find("CLAUDE_CONFIG_DIR='/home/u/.agentdeck/work'") != std::string::npos);
        assert(dirLine.rfind("clear && HISTFILE= ", 0) == 0);
        std::cout << "[PASS] BuildRelaunchCommand" << std::endl;
    }

    std::cout << "[Test] OutputPatterns Test Completed." << std::endl;
    return 0;
}
