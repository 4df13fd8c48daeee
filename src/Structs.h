#pragma once

#include <string>
#include <vector>

namespace homepair {

	// Schema migrations, applied in order. The number of applied queries is stored in the user_version pragma, so
	// existing queries should never be altered or removed; append new ones instead.
	const std::vector<std::string> c_queries = {

		// Settings
		"CREATE TABLE IF NOT EXISTS `settings` ( "
		"`key` VARCHAR(64) NOT NULL, "
		"`value` TEXT NOT NULL, "
		"`last_update` TIMESTAMP DEFAULT CURRENT_TIMESTAMP NOT NULL, "
		"PRIMARY KEY (`key`) )",

		// Pairings
		"CREATE TABLE IF NOT EXISTS `pairings` ( "
		"`id` CHAR(36) NOT NULL, " // lower case hyphenated uuid
		"`public_key` VARCHAR(64) NOT NULL, " // hex encoded ed25519 public key
		"`permissions` INTEGER NOT NULL, "
		"`created` TIMESTAMP DEFAULT CURRENT_TIMESTAMP NOT NULL, "
		"PRIMARY KEY (`id`) )",

		"CREATE INDEX IF NOT EXISTS `ix_pairings_permissions` ON `pairings`( `permissions` )",

	};

}; // namespace homepair
