//  elicitor
//  Typed survey data model: paths, responses, question trees and overrides
//  version 0.1.0 | MIT License
#pragma once

// Core data model
#include "elicitor/path.hh"
#include "elicitor/value.hh"
#include "elicitor/errors.hh"
#include "elicitor/responses.hh"
#include "elicitor/question.hh"

// Validation, overrides and collection
#include "elicitor/validation.hh"
#include "elicitor/merge.hh"
#include "elicitor/backend.hh"
#include "elicitor/survey.hh"

// YAML documents (fkYAML)
#include "elicitor/yaml.hh"
