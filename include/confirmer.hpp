//
//  confirmer.hpp
//  AutoVideo
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <iosfwd>
#include <string>

namespace autovideo {

// Answers yes/no questions raised by soft limits (too many videos, long videos).
class Confirmer {
   public:
    virtual ~Confirmer() = default;

    // True to continue.
    virtual bool confirm(const std::string &prompt) = 0;

    // When set, a declined confirmation is reported as a validation error with this hint
    // rather than as a plain "declined".
    virtual const char *refusal_hint() const { return nullptr; }
};

// Prompts on an output stream and reads one line; "y"/"Y" accepts.
class InteractiveConfirmer : public Confirmer {
   public:
    InteractiveConfirmer(std::istream &in, std::ostream &out) : in_(in), out_(out) {}
    bool confirm(const std::string &prompt) override;

   private:
    std::istream &in_;
    std::ostream &out_;
};

// Fixed answer, echoing the prompt with the chosen answer (yes-to-all / no-to-all).
class FixedConfirmer : public Confirmer {
   public:
    explicit FixedConfirmer(bool answer, std::ostream *echo = nullptr)
        : answer_(answer), echo_(echo) {}
    bool confirm(const std::string &prompt) override;

   private:
    bool answer_;
    std::ostream *echo_;
};

// Headless front-ends: every confirmation is refused with a structured error.
class RefusingConfirmer : public Confirmer {
   public:
    bool confirm(const std::string &prompt) override;
    const char *refusal_hint() const override;
};

}  // namespace autovideo
