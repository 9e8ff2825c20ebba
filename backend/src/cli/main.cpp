#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sys/utsname.h>
#include <unistd.h>

#include "../utils/Config.hpp"
#include "../utils/logging.hpp"
#include "../utils/EchoGuard.hpp"
#include "../auth/AuthManager.hpp"
#include "../auth/EmergencyReset.hpp"
#include "../auth/PasswordHasher.hpp"
#include "../auth/SessionOperations.hpp"
#include "../storage/CredentialStore.hpp"
#include "../storage/ProtectedDataStore.hpp"
#include "../storage/StorageError.hpp"

namespace fs = std::filesystem;

// Stores and authenticator bound to one data directory.
struct Vault {
    explicit Vault(const Config& cfg)
        : dir(cfg.storage.data_dir),
        users(dir / "user_data.json"),
        data(dir / "protected_data.json"),
        auth(users, cfg.auth)
    {
    }

    fs::path dir;
    JsonCredentialStore users;
    JsonProtectedDataStore data;
    AuthManager auth;
};

static std::string ask(const std::string& prompt) {
    std::cout << prompt;
    std::string line;
    if (!std::getline(std::cin, line)) {
        std::cout << "\n";
        std::exit(0);
    }
    return line;
}

// Same as ask() with echo off when stdin is a terminal.
static std::string askSecret(const std::string& prompt) {
    std::cout << prompt << std::flush;
    std::string line;
    bool ok;
    {
        EchoGuard quiet(STDIN_FILENO);
        ok = static_cast<bool>(std::getline(std::cin, line));
    }
    std::cout << "\n";
    if (!ok) std::exit(0);
    return line;
}

static std::string trim(std::string s) {
    while (!s.empty() && std::isspace((unsigned char)s.front())) s.erase(s.begin());
    while (!s.empty() && std::isspace((unsigned char)s.back())) s.pop_back();
    return s;
}

static int askChoice(const std::string& prompt) {
    std::string line = trim(ask(prompt));
    try {
        return std::stoi(line);
    }
    catch (const std::logic_error&) {
        return -1;
    }
}

// Asks twice; empty string when the two entries differ.
static std::string askNewPassword(const std::string& prompt) {
    std::string pw = askSecret(prompt);
    std::string confirm = askSecret("Confirm password: ");
    if (pw != confirm) {
        std::cout << "Passwords do not match!\n";
        return "";
    }
    return pw;
}

static void report(AuthStatus status, const std::string& success) {
    if (status == AuthStatus::Ok) std::cout << success << "\n";
    else std::cout << "Failed: " << toString(status) << ".\n";
}

static void logSystemDetails() {
    struct utsname info;
    if (uname(&info) == 0)
        spdlog::info("System details: {} {}", info.sysname, info.release);
}

static void createFirstUser(Vault& v) {
    std::cout << "\nNo users exist. You must create the first user.\n"
        "\n==== USER REGISTRATION ====\n"
        "First user created will be an administrator.\n";

    while (!v.auth.hasUsers()) {
        std::string username = trim(ask("Enter new username: "));
        std::string password = askNewPassword("Enter password: ");
        if (password.empty()) continue;

        AuthStatus status = v.auth.createFirstUser(username, password);
        report(status, "User '" + username + "' created successfully with role 'admin'!");
    }
}

static void registerUser(SessionOperations& ops) {
    std::cout << "\n==== USER REGISTRATION ====\n";
    std::string username = trim(ask("Enter new username: "));
    std::string password = askNewPassword("Enter password: ");
    if (password.empty()) return;

    std::string roleLine = trim(ask("Enter role (admin/user): "));
    for (auto& c : roleLine) c = static_cast<char>(std::tolower((unsigned char)c));
    Role role = roleFromString(roleLine).value_or(Role::User);

    report(ops.registerUser(username, password, role),
        "User '" + username + "' created successfully with role '" + roleToString(role) + "'!");
}

static void resetUserPassword(SessionOperations& ops) {
    std::cout << "\n==== ADMIN PASSWORD RESET ====\nAvailable users:\n";

    std::vector<std::pair<std::string, Role>> all;
    if (ops.listUsers(all) != AuthStatus::Ok) {
        std::cout << "Permission denied.\n";
        return;
    }
    for (const auto& [name, role] : all)
        std::cout << "- " << name << " (" << roleToString(role) << ")\n";

    std::string target = trim(ask("\nEnter username to reset: "));
    std::string password = askNewPassword("Enter new password for user: ");
    if (password.empty()) return;

    report(ops.resetOtherPassword(target, password), "Password for " + target + " has been reset successfully!");
}

static void userMenu(SessionOperations& ops) {
    const Session& s = ops.session();

    while (true) {
        std::cout << "\n===== Welcome " << s.username << " =====\n"
            "1. View Notes\n"
            "2. Add Note\n"
            "3. View Files\n"
            "4. Add File Reference\n"
            "5. Change Password\n";
        if (s.isAdmin()) {
            std::cout << "6. Register New User\n"
                "7. Reset User Password\n";
        }
        std::cout << "0. Logout\n";

        int choice = askChoice("\nEnter your choice: ");

        if (choice == 1) {
            auto notes = ops.listNotes();
            if (notes.empty()) { std::cout << "\nNo notes found.\n"; continue; }
            std::cout << "\n==== YOUR NOTES ====\n";
            for (size_t i = 0; i < notes.size(); ++i)
                std::cout << i + 1 << ". " << notes[i].content
                    << "  (" << formatIsoTime(notes[i].created_at) << ")\n";
        }
        else if (choice == 2) {
            report(ops.addNote(ask("\nEnter your note: ")), "Note added successfully!");
        }
        else if (choice == 3) {
            auto files = ops.listFiles();
            if (files.empty()) { std::cout << "\nNo files found.\n"; continue; }
            std::cout << "\n==== YOUR FILES ====\n";
            for (size_t i = 0; i < files.size(); ++i)
                std::cout << i + 1 << ". " << files[i].name << "\n";
        }
        else if (choice == 4) {
            report(ops.addFile(trim(ask("\nEnter file name: "))), "File reference added.");
        }
        else if (choice == 5) {
            std::string pw = askNewPassword("Enter new password: ");
            if (!pw.empty()) report(ops.changeOwnPassword(pw), "Password changed successfully!");
        }
        else if (choice == 6 && s.isAdmin()) {
            registerUser(ops);
        }
        else if (choice == 7 && s.isAdmin()) {
            resetUserPassword(ops);
        }
        else if (choice == 0) {
            std::cout << "Logging out...\n";
            spdlog::info("User '{}' logged out", s.username);
            return;
        }
        else {
            std::cout << "Invalid choice. Try again.\n";
        }
    }
}

static void emergencyReset(Vault& v, const AuthConfig& cfg) {
    std::cout << "\n==== EMERGENCY PROFILE RESET ====\n"
        "WARNING: This will reset your password but preserve your data.\n"
        "You will need to verify your identity to proceed.\n";

    EmergencyReset reset(v.auth, std::chrono::seconds(cfg.reset_code_ttl_seconds),
        EmergencyReset::randomCodeGenerator(cfg.reset_code_length),
        [](const std::string&, const std::string& code) {
            std::cout << "\nIn a real system, a verification code would be sent to your\n"
                "registered email or phone. For this demo, use this code:\n"
                "SECURITY CODE: " << code << "\n";
        },
        systemClock(), cfg.reset_max_code_attempts);

    std::string username = trim(ask("\nEnter your username: "));
    if (reset.requestReset(username) != AuthStatus::Ok) {
        std::cout << "Username not found.\n";
        return;
    }

    AuthStatus status = reset.verify(username, ask("\nEnter the security code: "));
    if (status != AuthStatus::Ok) {
        std::cout << "Verification failed: " << toString(status) << ". Reset failed.\n";
        return;
    }

    std::string password = askNewPassword("Enter new password: ");
    if (password.empty()) {
        std::cout << "Reset canceled.\n";
        return;
    }

    report(reset.completeReset(username, password),
        "\nPassword for " + username + " has been reset successfully!\nYou can now log in with your new password.");
}

static void login(Vault& v) {
    std::cout << "\n==== SECURITY SYSTEM LOGIN ====\n";
    std::string username = trim(ask("Username: "));
    std::string password = askSecret("Password: ");

    LoginResult result = v.auth.login(username, password);
    if (result.status == AuthStatus::Frozen) {
        std::cout << "\nAccount is frozen. Try again in " << result.remaining_seconds << " seconds.\n";
        return;
    }
    if (!result.ok()) {
        std::cout << "Invalid username or password\n";
        return;
    }

    std::cout << "\nWelcome, " << result.session->username << "!\n";
    SessionOperations ops(*result.session, v.auth, v.data);
    userMenu(ops);
}

static std::unique_ptr<Vault> openVault(const Config& cfg) {
    auto v = std::make_unique<Vault>(cfg);
    std::cout << "User data file: " << fs::absolute(v->users.path()).string() << "\n"
        << "Protected data file: " << fs::absolute(v->data.path()).string() << "\n";
    spdlog::info("Data directory: '{}'", fs::absolute(v->dir).string());
    return v;
}

static int run(Config cfg) {
    std::cout << "Initializing Security System...\n";
    auto vault = openVault(cfg);

    if (!vault->auth.hasUsers())
        createFirstUser(*vault);

    while (true) {
        std::cout << "\n===== SECURITY SYSTEM =====\n"
            "Data location: " << vault->dir.string() << "\n"
            "1. Login\n"
            "2. Change Data Directory\n"
            "3. Emergency Profile Reset\n"
            "4. Exit\n";

        int choice = askChoice("\nEnter your choice (1-4): ");

        if (choice == 1) {
            login(*vault);
        }
        else if (choice == 2) {
            std::string dir = trim(ask("\nEnter new data directory path (leave blank to cancel): "));
            if (dir.empty()) continue;

            std::error_code ec;
            fs::create_directories(dir, ec);
            if (ec) {
                std::cout << "Error creating directory: " << ec.message() << "\n";
                continue;
            }

            std::cout << "Switching to new data directory: " << dir << "\n";
            cfg.storage.data_dir = dir;
            vault = openVault(cfg);
            if (!vault->auth.hasUsers())
                createFirstUser(*vault);
        }
        else if (choice == 3) {
            emergencyReset(*vault, cfg.auth);
        }
        else if (choice == 4) {
            std::cout << "\nExiting system. Goodbye!\n";
            return 0;
        }
        else {
            std::cout << "Invalid choice. Try again.\n";
        }
    }
}

int main(int argc, char** argv) {
    Config cfg;
    try {
        cfg = loadConfig(argc > 1 ? argv[1] : "config.yaml");
        Log::init(cfg.logging);
        PasswordHasher::init();
    }
    catch (const std::exception& e) {
        std::cerr << "Startup failed: " << e.what() << "\n";
        return 1;
    }

    logSystemDetails();

    try {
        return run(cfg);
    }
    catch (const StorageError& e) {
        spdlog::error("Storage failure: {}", e.what());
        std::cerr << "Storage failure: " << e.what() << "\n";
        return 2;
    }
}
